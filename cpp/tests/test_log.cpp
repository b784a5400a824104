#include <catch2/catch_test_macros.hpp>
#include "test_helpers.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace blobstrip;
using namespace fixtures;

namespace fs = std::filesystem;

static std::string read_file(const fs::path& p) {
    std::ifstream in(p);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TEST_CASE("Logger: file sink receives messages at or above the level", "[log]") {
    auto dir = make_temp_repo();
    fs::create_directories(dir);
    auto file = dir / "blobstrip.log";

    Logger::init("info", file.string());
    BLOBSTRIP_LOG_DEBUG("hidden {}", 1);
    BLOBSTRIP_LOG_INFO("shown {}", 2);
    Logger::get()->flush();

    auto text = read_file(file);
    CHECK(text.find("shown 2") != std::string::npos);
    CHECK(text.find("hidden 1") == std::string::npos);

    Logger::init();
    fs::remove_all(dir);
}

TEST_CASE("Logger: unknown level falls back to warn", "[log]") {
    Logger::init("loud");
    CHECK(Logger::get()->level() == spdlog::level::warn);
    Logger::init("off");
    CHECK(Logger::get()->level() == spdlog::level::off);
    Logger::init();
}
