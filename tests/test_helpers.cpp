// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "test_helpers.h"
#include "Logger.h"
#include "nlohmann/json.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Keep test output readable: only errors from the library
// Test ciktisini okunur tut: kutuphaneden yalnizca hatalar
class QuietLogEnvironment : public ::testing::Environment {
public:
    void SetUp() override { Logger::instance().setLevel(LogLevel::Error); }
};

[[maybe_unused]] const auto* const kQuietLog = ::testing::AddGlobalTestEnvironment(new QuietLogEnvironment);

} // namespace

namespace testutil {

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "bundleloc";
    path_ = fs::temp_directory_path() /
            ("bundleloc_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + "_" + name);
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write " + path);
    out << content;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> RecordedRequest::texts() const {
    std::vector<std::string> out;
    for (const auto& [k, v] : form) {
        if (k == "text") out.push_back(v);
    }
    return out;
}

std::string RecordedRequest::field(const std::string& name) const {
    for (const auto& [k, v] : form) {
        if (k == name) return v;
    }
    for (const auto& [k, v] : headers) {
        if (k == name) return v;
    }
    return "";
}

FakeTransport::FakeTransport()
    : handler_([](const RecordedRequest& req, size_t) { return echo(req); }) {}

TransportResponse FakeTransport::postForm(const std::string& host,
                                          const std::string& path,
                                          const FieldList& form,
                                          const FieldList& headers,
                                          int) {
    requests_.push_back(RecordedRequest{host, path, form, headers});
    return handler_(requests_.back(), requests_.size() - 1);
}

TransportResponse FakeTransport::echo(const RecordedRequest& req) {
    json items = json::array();
    std::string lang = req.field("target_lang");
    for (const auto& text : req.texts()) {
        items.push_back({{"detected_source_language", "EN"}, {"text", lang + ":" + text}});
    }
    TransportResponse res;
    res.ok = true;
    res.status = 200;
    res.body = json{{"translations", items}}.dump();
    return res;
}

TransportResponse FakeTransport::failure(const std::string& error) {
    TransportResponse res;
    res.ok = false;
    res.error = error;
    return res;
}

} // namespace testutil
