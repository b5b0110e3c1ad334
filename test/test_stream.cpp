// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the stream building blocks: contexts, byte streams,
// datapacks, channels, producers, handlers and settings.

#include "test_framework.h"

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "crypto/sha256.h"
#include "stream/byte_stream.h"
#include "stream/context.h"
#include "stream/data_channel.h"
#include "stream/datapack.h"
#include "stream/error_channel.h"
#include "stream/file_producer.h"
#include "stream/handlers.h"
#include "stream/producer.h"
#include "stream/settings.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::filesystem::path write_temp_file(const std::string& name,
                                      const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << body;
    return path;
}

std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // anonymous namespace

// ============================================================================
// Context
// ============================================================================

TEST_CASE(Context, background_is_live) {
    auto root = stream::Context::background();
    CHECK(root != nullptr);
    CHECK(!root->is_done());
    CHECK(root->err().is_ok());
    CHECK(!root->deadline().has_value());
    CHECK(!root->value("path").has_value());

    root->cancel();
    CHECK(!root->is_done());
}

TEST_CASE(Context, cancel_propagates_to_children) {
    auto parent = stream::Context::with_cancel(stream::Context::background());
    auto child  = stream::Context::with_value(parent, "k", "v");
    CHECK(!child->is_done());

    parent->cancel();
    CHECK(parent->is_done());
    CHECK(child->is_done());
    CHECK_EQ(child->err().code(), core::ErrorCode::CONTEXT_CANCELLED);
}

TEST_CASE(Context, cancel_does_not_reach_parent) {
    auto parent = stream::Context::with_cancel(stream::Context::background());
    auto child  = stream::Context::with_cancel(parent);
    child->cancel();
    CHECK(child->is_done());
    CHECK(!parent->is_done());
}

TEST_CASE(Context, deadline_expires) {
    auto ctx = stream::Context::with_timeout(stream::Context::background(),
                                             std::chrono::milliseconds(10));
    CHECK(ctx->deadline().has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(ctx->is_done());
    CHECK_EQ(ctx->err().code(), core::ErrorCode::CONTEXT_DEADLINE);
}

TEST_CASE(Context, earliest_deadline_wins) {
    auto now   = stream::Context::Clock::now();
    auto outer = stream::Context::with_deadline(
        stream::Context::background(), now + std::chrono::seconds(5));
    auto inner = stream::Context::with_deadline(
        outer, now + std::chrono::seconds(60));
    CHECK(inner->deadline().has_value());
    CHECK(*inner->deadline() == now + std::chrono::seconds(5));
}

TEST_CASE(Context, value_lookup_nearest_first) {
    auto a = stream::Context::with_value(stream::Context::background(),
                                         "path", "/outer");
    auto b = stream::Context::with_value(a, "user", "alice");
    auto c = stream::Context::with_value(b, "path", "/inner");
    CHECK_EQ(c->value("path").value_or(""), "/inner");
    CHECK_EQ(c->value("user").value_or(""), "alice");
    CHECK_EQ(b->value("path").value_or(""), "/outer");
    CHECK(!c->value("missing").has_value());
}

// ============================================================================
// ByteStream
// ============================================================================

TEST_CASE(ByteStream, buffer_reads_in_chunks) {
    stream::BufferStream s(std::string_view("hello world"));
    CHECK_EQ(s.size(), 11u);

    std::vector<uint8_t> buf(4);
    auto n = s.read(buf);
    CHECK_OK(n);
    CHECK_EQ(n.value(), 4u);
    CHECK_EQ(as_string(std::vector<uint8_t>(buf.begin(), buf.end())), "hell");
    CHECK_EQ(s.remaining(), 7u);

    auto rest = stream::read_all(s, 3);
    CHECK_OK(rest);
    CHECK_EQ(as_string(rest.value()), "o world");

    auto eof = s.read(buf);
    CHECK_OK(eof);
    CHECK_EQ(eof.value(), 0u);
}

TEST_CASE(ByteStream, read_after_close_fails) {
    stream::BufferStream s(std::string_view("abc"));
    s.close();
    CHECK(s.is_closed());
    std::vector<uint8_t> buf(8);
    auto r = s.read(buf);
    CHECK(!r.ok());
    CHECK_EQ(r.error().code(), core::ErrorCode::STREAM_CLOSED);
    CHECK_NOTHROW(s.close());
}

TEST_CASE(ByteStream, file_stream_reads_file) {
    auto path = write_temp_file("sluice_test_stream.bin", "file contents");
    auto opened = stream::FileStream::open(path);
    CHECK_OK(opened);
    if (!opened.ok()) return;

    auto file = std::move(opened).value();
    CHECK(file->path() == path);
    auto all = stream::read_all(*file, 5);
    CHECK_OK(all);
    CHECK_EQ(as_string(all.value()), "file contents");

    file->close();
    std::vector<uint8_t> buf(4);
    auto r = file->read(buf);
    CHECK(!r.ok());
    CHECK_EQ(r.error().code(), core::ErrorCode::STREAM_CLOSED);
    std::filesystem::remove(path);
}

TEST_CASE(ByteStream, file_stream_open_errors) {
    auto missing = stream::FileStream::open("/nonexistent/sluice/file.bin");
    CHECK(!missing.ok());
    CHECK_EQ(missing.error().code(), core::ErrorCode::IO_NOT_FOUND);

    auto dir = stream::FileStream::open(std::filesystem::temp_directory_path());
    CHECK(!dir.ok());
    CHECK_EQ(dir.error().code(), core::ErrorCode::IO_ERROR);
}

// ============================================================================
// Datapack
// ============================================================================

TEST_CASE(Datapack, default_context_is_background) {
    auto pack = stream::make_datapack(std::string_view("x"));
    CHECK(pack != nullptr);
    CHECK(pack->context() != nullptr);
    CHECK(pack->context() == stream::Context::background());
    CHECK(pack->body() != nullptr);
}

TEST_CASE(Datapack, body_can_be_taken_and_replaced) {
    auto ctx  = stream::Context::with_value(stream::Context::background(),
                                            "id", "7");
    auto pack = stream::make_datapack(std::vector<uint8_t>{1, 2, 3}, ctx);
    CHECK_EQ(pack->context()->value("id").value_or(""), "7");

    std::unique_ptr<stream::ByteStream> taken = std::move(pack->body());
    CHECK(taken != nullptr);
    CHECK(pack->body() == nullptr);

    pack->body() = std::make_unique<stream::BufferStream>(
        std::string_view("new"));
    auto bytes = stream::read_all(*pack->body());
    CHECK_OK(bytes);
    CHECK_EQ(as_string(bytes.value()), "new");
}

// ============================================================================
// ErrorChannel
// ============================================================================

TEST_CASE(ErrorChannel, check_reports_errors_then_done) {
    stream::ErrorChannel ch(3, std::chrono::milliseconds(1));
    CHECK(ch.put(core::Error(core::ErrorCode::HANDLER_ERROR, "first")));
    CHECK(ch.put(core::Error(core::ErrorCode::HANDLER_ERROR, "second")));
    ch.close();

    auto p1 = ch.check();
    CHECK(p1.error.has_value());
    CHECK(!p1.done);
    CHECK_EQ(p1.error->message(), "first");

    auto p2 = ch.check();
    CHECK(p2.error.has_value());
    CHECK_EQ(p2.error->message(), "second");

    auto p3 = ch.check();
    CHECK(!p3.error.has_value());
    CHECK(p3.done);
}

TEST_CASE(ErrorChannel, check_on_open_empty_channel_is_neither) {
    stream::ErrorChannel ch(1, std::chrono::milliseconds(5));
    auto p = ch.check();
    CHECK(!p.error.has_value());
    CHECK(!p.done);
}

TEST_CASE(ErrorChannel, put_on_closed_channel_is_dropped) {
    stream::ErrorChannel ch(2);
    ch.close();
    CHECK(!ch.put(core::Error(core::ErrorCode::HANDLER_ERROR, "late")));
    CHECK_EQ(ch.size(), 0u);
}

TEST_CASE(ErrorChannel, invalid_arguments_throw) {
    CHECK_THROWS(stream::ErrorChannel(0), std::invalid_argument);
    stream::ErrorChannel ch(1);
    CHECK_THROWS(ch.put(core::Error()), std::invalid_argument);
}

TEST_CASE(ErrorChannel, non_positive_poll_falls_back) {
    stream::ErrorChannel ch(1, std::chrono::milliseconds(0));
    CHECK(ch.poll_interval() == stream::DEFAULT_POLL_INTERVAL);
    CHECK_EQ(ch.capacity(), 1u);
}

TEST_CASE(ErrorChannel, put_blocks_while_full) {
    stream::ErrorChannel ch(1, std::chrono::milliseconds(1));
    CHECK(ch.put(core::Error(core::ErrorCode::HANDLER_ERROR, "a")));

    std::atomic<bool> second_done{false};
    std::thread writer([&] {
        ch.put(core::Error(core::ErrorCode::HANDLER_ERROR, "b"));
        second_done = true;
        ch.close();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(!second_done.load());

    auto errors = ch.drain();
    writer.join();
    CHECK(second_done.load());
    CHECK_EQ(errors.size(), 2u);
    CHECK_EQ(errors[0].message(), "a");
    CHECK_EQ(errors[1].message(), "b");
}

TEST_CASE(ErrorChannel, stream_pair_defaults) {
    auto pair = stream::make_stream_pair();
    CHECK(pair.valid());
    CHECK_EQ(pair.errors->capacity(), stream::DEFAULT_ERROR_CAPACITY);
    CHECK(!pair.data->is_closed());

    stream::StreamPair empty;
    CHECK(!empty.valid());
}

// ============================================================================
// Producers
// ============================================================================

TEST_CASE(Producer, vector_producer_order_and_end) {
    std::vector<stream::DatapackPtr> packs;
    packs.push_back(stream::make_datapack(std::string_view("a")));
    packs.push_back(nullptr);
    packs.push_back(stream::make_datapack(std::string_view("c")));
    stream::VectorProducer producer(std::move(packs));

    auto first = producer.next();
    CHECK_OK(first);
    CHECK(first.value().pack != nullptr);
    CHECK(first.value().has_more);

    auto second = producer.next();
    CHECK_OK(second);
    CHECK(second.value().pack == nullptr);
    CHECK(second.value().has_more);

    auto third = producer.next();
    CHECK_OK(third);
    CHECK(third.value().pack != nullptr);
    CHECK(!third.value().has_more);
    CHECK_EQ(producer.calls(), 3u);
}

TEST_CASE(Producer, vector_producer_empty) {
    stream::VectorProducer producer(std::vector<stream::DatapackPtr>{});
    auto step = producer.next();
    CHECK_OK(step);
    CHECK(step.value().pack == nullptr);
    CHECK(!step.value().has_more);
}

TEST_CASE(Producer, file_producer_sets_path_value) {
    auto a = write_temp_file("sluice_test_fp_a.txt", "alpha");
    auto b = write_temp_file("sluice_test_fp_b.txt", "beta");
    stream::FileProducer producer(std::vector<std::filesystem::path>{a, b});

    auto first = producer.next();
    CHECK_OK(first);
    if (!first.ok()) return;
    auto& pack = first.value().pack;
    CHECK(pack != nullptr);
    CHECK(first.value().has_more);
    CHECK_EQ(pack->context()->value(stream::PATH_KEY).value_or(""),
             a.string());
    auto bytes = stream::read_all(*pack->body());
    CHECK_OK(bytes);
    CHECK_EQ(as_string(bytes.value()), "alpha");

    auto second = producer.next();
    CHECK_OK(second);
    CHECK(!second.value().has_more);
    CHECK_EQ(producer.opened(), 2u);

    std::filesystem::remove(a);
    std::filesystem::remove(b);
}

TEST_CASE(Producer, file_producer_missing_file) {
    stream::FileProducer producer(
        std::vector<std::filesystem::path>{"/nonexistent/sluice/missing.txt"});
    auto step = producer.next();
    CHECK(!step.ok());
    CHECK_EQ(step.error().code(), core::ErrorCode::IO_NOT_FOUND);
}

// ============================================================================
// Handlers (called directly)
// ============================================================================

TEST_CASE(Handlers, digest_handler_consumes_body) {
    std::string hex;
    auto handler = stream::digest_handler(
        [&](const stream::ContextPtr&, const crypto::Sha256Digest& d) {
            hex = crypto::to_hex(d);
        });

    std::unique_ptr<stream::ByteStream> body =
        std::make_unique<stream::BufferStream>(std::string_view("abc"));
    auto r = handler(stream::Context::background(), body);
    CHECK_OK(r);
    CHECK(body == nullptr);
    CHECK_EQ(hex,
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE(Handlers, digest_handler_honours_cancellation) {
    bool called = false;
    auto handler = stream::digest_handler(
        [&](const stream::ContextPtr&, const crypto::Sha256Digest&) {
            called = true;
        });
    auto ctx = stream::Context::with_cancel(stream::Context::background());
    ctx->cancel();

    std::unique_ptr<stream::ByteStream> body =
        std::make_unique<stream::BufferStream>(std::string_view("abc"));
    auto r = handler(ctx, body);
    CHECK(!r.ok());
    CHECK_EQ(r.error().code(), core::ErrorCode::CONTEXT_CANCELLED);
    CHECK(!called);
}

TEST_CASE(Handlers, digest_handler_reports_read_errors) {
    auto handler = stream::digest_handler({});
    auto closed = std::make_unique<stream::BufferStream>(
        std::string_view("abc"));
    closed->close();
    std::unique_ptr<stream::ByteStream> body = std::move(closed);
    auto r = handler(stream::Context::background(), body);
    CHECK(!r.ok());
    CHECK_EQ(r.error().code(), core::ErrorCode::STREAM_CLOSED);
}

TEST_CASE(Handlers, collect_handler_appends) {
    std::vector<uint8_t> sink;
    auto handler = stream::collect_handler(sink);
    for (const char* part : {"one", "two"}) {
        std::unique_ptr<stream::ByteStream> body =
            std::make_unique<stream::BufferStream>(std::string_view(part));
        CHECK_OK(handler(stream::Context::background(), body));
        CHECK(body == nullptr);
    }
    CHECK_EQ(as_string(sink), "onetwo");
}

// ============================================================================
// Settings
// ============================================================================

TEST_CASE(Settings, defaults) {
    core::Config cfg;
    auto s = stream::Settings::from_config(cfg);
    CHECK_OK(s);
    if (!s.ok()) return;
    CHECK_EQ(s.value().error_capacity, stream::DEFAULT_ERROR_CAPACITY);
    CHECK(s.value().poll_interval == stream::DEFAULT_POLL_INTERVAL);
    CHECK(s.value().log_level == core::LogLevel::INFO);
    CHECK(!s.value().log_categories.has_value());
    CHECK(!s.value().log_file.has_value());
    CHECK(s.value().print_to_console);
}

TEST_CASE(Settings, parses_values) {
    const char* argv[] = {"prog", "-errcap=9", "-pollms=3",
                          "-debug=producer,handler", "-printtoconsole=0"};
    core::Config cfg;
    cfg.parse_args(5, argv);
    auto s = stream::Settings::from_config(cfg);
    CHECK_OK(s);
    if (!s.ok()) return;
    CHECK_EQ(s.value().error_capacity, 9u);
    CHECK(s.value().poll_interval == std::chrono::milliseconds(3));
    CHECK(s.value().log_level == core::LogLevel::DEBUG);
    CHECK(s.value().log_categories ==
          (core::LogCategory::PRODUCER | core::LogCategory::HANDLER));
    CHECK(!s.value().print_to_console);
}

TEST_CASE(Settings, rejects_invalid_values) {
    for (const char* arg : {"-errcap=0", "-pollms=-5", "-errcap=x",
                            "-loglevel=loud", "-debug=net"}) {
        const char* argv[] = {"prog", arg};
        core::Config cfg;
        cfg.parse_args(2, argv);
        auto s = stream::Settings::from_config(cfg);
        CHECK(!s.ok());
        if (!s.ok()) {
            CHECK_EQ(s.error().code(), core::ErrorCode::CONFIG_INVALID);
        }
    }
}

TEST_CASE(Settings, merges_conf_file) {
    auto path = write_temp_file("sluice_test_settings.conf",
                                "errcap=12\nloglevel=warn\n");
    std::string conf_arg = "-conf=" + path.string();
    const char* argv[] = {"prog", conf_arg.c_str(), "-loglevel=error"};
    core::Config cfg;
    cfg.parse_args(3, argv);
    auto s = stream::Settings::from_config(cfg);
    CHECK_OK(s);
    if (s.ok()) {
        CHECK_EQ(s.value().error_capacity, 12u);
        CHECK(s.value().log_level == core::LogLevel::ERR);
    }
    std::filesystem::remove(path);
}

TEST_CASE(Settings, missing_conf_file) {
    const char* argv[] = {"prog", "-conf=/nonexistent/sluice.conf"};
    core::Config cfg;
    cfg.parse_args(2, argv);
    auto s = stream::Settings::from_config(cfg);
    CHECK(!s.ok());
    if (!s.ok()) {
        CHECK_EQ(s.error().code(), core::ErrorCode::IO_NOT_FOUND);
    }
}
