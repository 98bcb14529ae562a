// SPDX-License-Identifier: Apache-2.0
// Part of the VpnCtl (VCTL) project.
// tests/test_error.cpp

#include <gtest/gtest.h>
#include <cerrno>
#include <system_error>

#include "vctl/error.hpp"

namespace {

TEST(ErrorTest, CategoryAndMessages) {
    const std::error_code ec = vctl::errc::update_required;
    EXPECT_STREQ(ec.category().name(), "vctl");
    EXPECT_EQ(ec.message(), "application update required");
    EXPECT_EQ(std::error_code(vctl::errc::bad_pin).message(), "bad public key PIN");
    EXPECT_FALSE(std::error_code(vctl::errc::dns_no_ip).message().empty());
}

TEST(ErrorTest, CodesMapToKinds) {
    using vctl::errc;
    using vctl::error_kind;

    EXPECT_EQ(std::error_code(errc::invalid_public_key), error_kind::validation);
    EXPECT_EQ(std::error_code(errc::not_resolved), error_kind::validation);
    EXPECT_EQ(std::error_code(errc::dns_no_address), error_kind::resolution);
    EXPECT_EQ(std::error_code(errc::bad_pin), error_kind::transport);
    EXPECT_EQ(std::error_code(errc::cancelled), error_kind::transport);
    EXPECT_EQ(std::error_code(errc::update_required), error_kind::protocol);
    EXPECT_EQ(std::error_code(errc::filter_failed), error_kind::protocol);
    EXPECT_EQ(std::error_code(errc::bad_encoding), error_kind::decode);
    EXPECT_EQ(std::error_code(errc::token_write_failed), error_kind::persistence);

    EXPECT_NE(std::error_code(errc::update_required), error_kind::transport);
    EXPECT_NE(std::error_code(errc::bad_http_status), errc::update_required);
}

TEST(ErrorTest, SocketErrorsAreTransport) {
    const std::error_code refused(ECONNREFUSED, std::system_category());
    EXPECT_EQ(refused, vctl::error_kind::transport);
    EXPECT_NE(refused, vctl::error_kind::resolution);
}

} // namespace
