#pragma once

#include "quarry/format.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace quarry::internal::files {

    using namespace quarry::literals;
    namespace fs = std::filesystem;

    inline constexpr int supported_schema_version = 1;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {} for write"_format(path.string()));
        }
        out << text;
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    // unknown keys are tolerated so newer writers stay readable
    template <typename T>
    T parse_json_text(std::string json, std::string_view origin) {
        T value{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json); ec) {
            throw std::runtime_error(
                    "failed to parse json from {}: {}"_format(origin, glz::format_error(ec, json)));
        }
        return value;
    }

    template <typename T>
    T read_json_file(const fs::path& path) {
        return parse_json_text<T>(read_text_file(path), path.string());
    }

    template <typename T>
    std::string write_json_text(const T& value) {
        std::string json{};
        if (auto ec = glz::write<glz::opts{.prettify = true}>(value, json); ec) {
            throw std::runtime_error("failed to serialize json");
        }
        return json;
    }

    inline void validate_supported_schema_version(int schema_version, std::string_view origin) {
        if (schema_version < 1 || schema_version > supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} (supported: {})"_format(
                            origin, schema_version, supported_schema_version));
        }
    }

}  // namespace quarry::internal::files
