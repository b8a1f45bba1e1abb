/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present The devdns Authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */
#include "test_helper.hxx"

#include "core/io/dns_codec.hxx"
#include "core/io/upstream_client.hxx"
#include "core/resolution_engine.hxx"

#include <devdns/error_codes.hxx>

#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dns = devdns::core::io::dns;
using devdns::core::io::upstream_client;
using devdns::core::io::upstream_result;

namespace
{
/**
 * Recursive nameserver speaking DNS over TCP on the loopback interface. The responder builds the
 * reply for the decoded query: an empty reply closes the connection, and without a responder the
 * query is read but never answered.
 */
class fake_nameserver : public std::enable_shared_from_this<fake_nameserver>
{
public:
    using responder = std::function<std::vector<std::uint8_t>(const dns::dns_message&)>;

    fake_nameserver(asio::io_context& ctx, responder respond)
      : acceptor_(ctx, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0))
      , socket_(ctx)
      , respond_(std::move(respond))
    {
    }

    void accept()
    {
        acceptor_.async_accept(socket_, [self = shared_from_this()](std::error_code ec) {
            if (ec) {
                return;
            }
            asio::async_read(self->socket_, asio::buffer(self->size_buf_), [self](std::error_code ec2, std::size_t /* bytes_transferred */) {
                if (ec2) {
                    return;
                }
                self->query_size_ = static_cast<std::size_t>((self->size_buf_[0] << 8U) | self->size_buf_[1]);
                self->query_buf_.resize(self->query_size_);
                asio::async_read(self->socket_, asio::buffer(self->query_buf_), [self](std::error_code ec3, std::size_t /* bytes_transferred */) {
                    if (ec3) {
                        return;
                    }
                    self->on_query();
                });
            });
        });
    }

    void close()
    {
        std::error_code ignore_ec;
        acceptor_.close(ignore_ec);
        socket_.close(ignore_ec);
    }

    [[nodiscard]] auto config(std::chrono::milliseconds timeout = std::chrono::seconds{ 2 }) const -> dns::dns_config
    {
        return { "127.0.0.1", acceptor_.local_endpoint().port(), timeout };
    }

    [[nodiscard]] auto query() const -> const std::optional<dns::dns_message>&
    {
        return query_;
    }

    [[nodiscard]] auto query_size() const -> std::size_t
    {
        return query_size_;
    }

    [[nodiscard]] auto query_bytes() const -> const std::vector<std::uint8_t>&
    {
        return query_buf_;
    }

private:
    void on_query()
    {
        auto query = dns::dns_codec::decode(query_buf_);
        if (!query) {
            return close();
        }
        query_ = query.value();
        if (!respond_) {
            return;
        }
        auto body = respond_(query_.value());
        if (body.empty()) {
            return close();
        }
        reply_.clear();
        reply_.push_back(static_cast<std::uint8_t>(body.size() >> 8U));
        reply_.push_back(static_cast<std::uint8_t>(body.size() & 0xffU));
        reply_.insert(reply_.end(), body.begin(), body.end());
        asio::async_write(socket_, asio::buffer(reply_), [self = shared_from_this()](std::error_code /* ec */, std::size_t /* bytes_transferred */) {
        });
    }

    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::socket socket_;
    responder respond_;
    std::array<std::uint8_t, 2> size_buf_{};
    std::size_t query_size_{ 0 };
    std::vector<std::uint8_t> query_buf_{};
    std::optional<dns::dns_message> query_{};
    std::vector<std::uint8_t> reply_{};
};

auto
make_reply(const dns::dns_message& query,
           const std::vector<std::string>& addresses,
           dns::response_code rcode = dns::response_code::no_error) -> std::vector<std::uint8_t>
{
    dns::dns_message reply{};
    reply.header.id = query.header.id;
    reply.header.flags.qr = dns::message_type::response;
    reply.header.flags.rd = query.header.flags.rd;
    reply.header.flags.ra = dns::recursion_available::yes;
    reply.header.flags.rcode = rcode;
    reply.questions = query.questions;
    for (const auto& address : addresses) {
        dns::a_record record{};
        record.name = query.questions.front().name;
        record.ttl = 60;
        record.address = asio::ip::make_address_v4(address);
        reply.answers.emplace_back(std::move(record));
    }
    return dns::dns_codec::encode(reply);
}

void
append_name(std::vector<std::uint8_t>& payload, const std::vector<std::string>& labels)
{
    for (const auto& label : labels) {
        payload.push_back(static_cast<std::uint8_t>(label.size()));
        payload.insert(payload.end(), label.begin(), label.end());
    }
    payload.push_back(0x00);
}

/**
 * Reply to the query with "CNAME edge.example.test" followed by "edge.example.test A 93.184.216.34".
 */
auto
make_cname_reply(const dns::dns_message& query) -> std::vector<std::uint8_t>
{
    auto payload = make_reply(query, {});
    payload[7] = 2; // ANCOUNT

    // the question name starts right after the header
    payload.insert(payload.end(), { 0xc0, 0x0c, 0x00, 0x05, 0x00, 0x01, 0x00, 0x00, 0x0e, 0x10, 0x00, 0x13 });
    const auto target_offset = payload.size();
    append_name(payload, { "edge", "example", "test" });

    payload.push_back(static_cast<std::uint8_t>(0xc0U | (target_offset >> 8U)));
    payload.push_back(static_cast<std::uint8_t>(target_offset & 0xffU));
    payload.insert(payload.end(), { 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x0e, 0x10, 0x00, 0x04, 93, 184, 216, 34 });
    return payload;
}

auto
resolve(asio::io_context& ctx, upstream_client& client, const std::string& hostname) -> std::optional<upstream_result>
{
    std::optional<upstream_result> result{};
    client.resolve(hostname, [&result](upstream_result&& res) {
        result = std::move(res);
    });
    test::utils::run_until(ctx, [&result]() { return result.has_value(); });
    return result;
}
} // namespace

TEST_CASE("unit: upstream client sends length-prefixed A query", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;
    auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
        return make_reply(query, { "140.82.112.3", "140.82.112.4" });
    });
    nameserver->accept();

    upstream_client client(ctx, nameserver->config());
    CHECK(client.address() == nameserver->config().to_string());

    auto result = resolve(ctx, client, "github.com");
    REQUIRE(result.has_value());
    REQUIRE_SUCCESS(result->ec);
    REQUIRE(result->answers.size() == 2);
    CHECK(result->answers[0].name == "github.com");
    CHECK(result->answers[0].address == "140.82.112.3");
    CHECK(result->answers[0].ttl == devdns::core::answer_ttl);
    CHECK(result->answers[1].address == "140.82.112.4");

    REQUIRE(nameserver->query().has_value());
    const auto& query = nameserver->query().value();
    CHECK(nameserver->query_size() == nameserver->query_bytes().size());
    CHECK(nameserver->query_size() == dns::dns_codec::encoded_size(query));
    CHECK(query.header.flags.qr == dns::message_type::query);
    CHECK(query.header.flags.rd == dns::recursion_desired::yes);
    REQUIRE(query.questions.size() == 1);
    CHECK(query.questions[0].name.to_string() == "github.com");
    CHECK(query.questions[0].type == dns::resource_type::a);
    CHECK(query.questions[0].klass == dns::resource_class::in);
}

TEST_CASE("unit: upstream client keeps A records behind CNAME", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;
    auto nameserver = std::make_shared<fake_nameserver>(ctx, make_cname_reply);
    nameserver->accept();

    upstream_client client(ctx, nameserver->config());
    auto result = resolve(ctx, client, "www.example.test");
    REQUIRE(result.has_value());
    REQUIRE_SUCCESS(result->ec);
    REQUIRE(result->answers.size() == 1);
    CHECK(result->answers[0].name == "www.example.test");
    CHECK(result->answers[0].address == "93.184.216.34");
    CHECK(result->answers[0].ttl == devdns::core::answer_ttl);
}

TEST_CASE("unit: upstream client response codes", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;

    SECTION("NXDOMAIN is an empty answer")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
            return make_reply(query, {}, dns::response_code::name_error);
        });
        nameserver->accept();
        upstream_client client(ctx, nameserver->config());
        auto result = resolve(ctx, client, "missing.example.test");
        REQUIRE(result.has_value());
        REQUIRE_SUCCESS(result->ec);
        CHECK(result->answers.empty());
    }

    SECTION("SERVFAIL")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
            return make_reply(query, {}, dns::response_code::server_failure);
        });
        nameserver->accept();
        upstream_client client(ctx, nameserver->config());
        auto result = resolve(ctx, client, "broken.example.test");
        REQUIRE(result.has_value());
        CHECK(result->ec == devdns::errc::network::upstream_failure);
        CHECK(result->answers.empty());
    }

    SECTION("REFUSED")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
            return make_reply(query, { "10.0.0.1" }, dns::response_code::refused);
        });
        nameserver->accept();
        upstream_client client(ctx, nameserver->config());
        auto result = resolve(ctx, client, "refused.example.test");
        REQUIRE(result.has_value());
        CHECK(result->ec == devdns::errc::network::upstream_failure);
        CHECK(result->answers.empty());
    }
}

TEST_CASE("unit: upstream client rejects unexpected responses", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;

    SECTION("id mismatch")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
            auto other = query;
            other.header.id = static_cast<std::uint16_t>(query.header.id + 1);
            return make_reply(other, { "10.0.0.1" });
        });
        nameserver->accept();
        upstream_client client(ctx, nameserver->config());
        auto result = resolve(ctx, client, "github.com");
        REQUIRE(result.has_value());
        CHECK(result->ec == devdns::errc::network::protocol_error);
        CHECK(result->answers.empty());
    }

    SECTION("query echoed back")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
            return dns::dns_codec::encode(query);
        });
        nameserver->accept();
        upstream_client client(ctx, nameserver->config());
        auto result = resolve(ctx, client, "github.com");
        REQUIRE(result.has_value());
        CHECK(result->ec == devdns::errc::network::protocol_error);
    }

    SECTION("truncated message")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
            auto reply = make_reply(query, { "10.0.0.1" });
            reply.resize(reply.size() - 2);
            return reply;
        });
        nameserver->accept();
        upstream_client client(ctx, nameserver->config());
        auto result = resolve(ctx, client, "github.com");
        REQUIRE(result.has_value());
        CHECK(result->ec == devdns::errc::network::protocol_error);
    }

    SECTION("connection closed without reply")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& /* query */) {
            return std::vector<std::uint8_t>{};
        });
        nameserver->accept();
        upstream_client client(ctx, nameserver->config());
        auto result = resolve(ctx, client, "github.com");
        REQUIRE(result.has_value());
        CHECK(result->ec == devdns::errc::network::end_of_stream);
    }
}

TEST_CASE("unit: upstream client deadline", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;
    auto nameserver = std::make_shared<fake_nameserver>(ctx, nullptr);
    nameserver->accept();

    upstream_client client(ctx, nameserver->config(std::chrono::milliseconds{ 200 }));
    auto result = resolve(ctx, client, "slow.example.test");
    REQUIRE(result.has_value());
    CHECK(result->ec == devdns::errc::common::unambiguous_timeout);
    CHECK(result->answers.empty());
    CHECK(nameserver->query().has_value());

    nameserver->close();
}

TEST_CASE("unit: upstream client connection errors", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;

    SECTION("nameserver is not an address")
    {
        upstream_client client(ctx, { "dns.example.test", 53 });
        auto result = resolve(ctx, client, "github.com");
        REQUIRE(result.has_value());
        CHECK(result->ec == devdns::errc::common::invalid_argument);
        CHECK(result->answers.empty());
    }

    SECTION("nothing listens on the port")
    {
        auto nameserver = std::make_shared<fake_nameserver>(ctx, nullptr);
        auto config = nameserver->config();
        nameserver->close();

        upstream_client client(ctx, config);
        auto result = resolve(ctx, client, "github.com");
        REQUIRE(result.has_value());
        CHECK(result->ec);
        CHECK(result->answers.empty());
    }
}

TEST_CASE("unit: NXDOMAIN from primary falls back to secondary", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;
    auto first = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
        return make_reply(query, {}, dns::response_code::name_error);
    });
    first->accept();
    auto second = std::make_shared<fake_nameserver>(ctx, [](const dns::dns_message& query) {
        return make_reply(query, { "192.168.1.10" });
    });
    second->accept();

    auto engine = std::make_shared<devdns::core::resolution_engine>(
      nullptr,
      nullptr,
      std::make_shared<upstream_client>(ctx, first->config()),
      std::make_shared<upstream_client>(ctx, second->config()));

    std::optional<std::vector<devdns::core::resolution_answer>> answers{};
    engine->resolve("intranet.example.test", [&answers](std::vector<devdns::core::resolution_answer>&& result) {
        answers = std::move(result);
    });
    test::utils::run_until(ctx, [&answers]() { return answers.has_value(); });

    REQUIRE(answers.has_value());
    REQUIRE(answers->size() == 1);
    CHECK(answers->at(0).name == "intranet.example.test");
    CHECK(answers->at(0).address == "192.168.1.10");
    CHECK(first->query().has_value());
    CHECK(second->query().has_value());
}
