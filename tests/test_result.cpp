/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */


#include <gtest/gtest.h>

#include <stdexcept>

#include "rhc/errors.hpp"
#include "rhc/result.hpp"

using namespace rhc;

namespace {

Response ok_response() {
    Response r;
    r.status_code = 200;
    r.status_message = "OK";
    return r;
}

} // namespace

TEST(Result, SuccessFillsValueSlot) {
    Result r = to_result([] { return ok_response(); });

    auto [err, resp] = r;
    EXPECT_EQ(err, nullptr);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status_code, 200);
}

TEST(Result, TypedErrorKeepsDynamicType) {
    Result r = to_result([]() -> Response { throw RequestTimeoutError(); });

    ASSERT_FALSE(r.ok());
    EXPECT_FALSE(r.value.has_value());
    EXPECT_NE(dynamic_cast<RequestTimeoutError*>(r.error.get()), nullptr);
    EXPECT_EQ(r.error->kind(), ErrorKind::Timeout);
}

TEST(Result, StatusErrorCarriesResponse) {
    Response failed;
    failed.status_code = 418;
    failed.status_message = "I'm a teapot";

    Result r = to_result([&]() -> Response { throw StatusError(failed); });

    auto* se = dynamic_cast<StatusError*>(r.error.get());
    ASSERT_NE(se, nullptr);
    EXPECT_EQ(se->status_code(), 418);
    EXPECT_EQ(se->response().status_message, "I'm a teapot");
    EXPECT_STREQ(se->what(), "Request failed with status code 418");
}

TEST(Result, ForeignExceptionBecomesTransportError) {
    Result r = to_result([]() -> Response { throw std::runtime_error("boom"); });

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind(), ErrorKind::Transport);
    EXPECT_STREQ(r.error->what(), "boom");
}

TEST(Result, NonStandardThrowBecomesTransportError) {
    Result r = to_result([]() -> Response { throw 42; });

    ASSERT_FALSE(r.ok());
    EXPECT_FALSE(r.value.has_value());
    EXPECT_EQ(r.error->kind(), ErrorKind::Transport);
    EXPECT_STREQ(r.error->what(), "unknown error");
}

TEST(Errors, KindsAndMessages) {
    EXPECT_STREQ(ValidationError("x").what(), "x");
    EXPECT_EQ(ValidationError("x").kind(), ErrorKind::Validation);
    EXPECT_STREQ(ServiceUnavailableError().what(), "Failed due abort reason");
    EXPECT_EQ(ServiceUnavailableError().kind(), ErrorKind::Abort);
    EXPECT_EQ(DecodeError("bad", "raw", 502).status_code(), 502);
    EXPECT_STREQ(error_kind_name(ErrorKind::Decode), "decode");
}

TEST(Errors, CloneIsDeep) {
    const DecodeError original("unexpected end", "{\"a\":", 200);

    std::shared_ptr<Error> copy = original.clone();

    auto* de = dynamic_cast<DecodeError*>(copy.get());
    ASSERT_NE(de, nullptr);
    EXPECT_EQ(de->raw_body(), "{\"a\":");
    EXPECT_EQ(de->status_code(), 200);
}
