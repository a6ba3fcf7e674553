#pragma once

#include "resume/TextMeasurer.hpp"
#include "text/TextUtil.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace testutil {

// Every code point is half the font size wide.
class FixedWidthMeasurer final : public resume::TextMeasurer {
public:
    double text_width(const resume::TextStyle& style, const std::string& text) const override {
        return static_cast<double>(textutil::utf8_length(text)) * style.size * 0.5;
    }
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(stamp));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        const std::filesystem::path p = path_ / name;
        std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
        out << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

}  // namespace testutil
