//! # Capture Options Implementation

#include "shapebuf/buffer/buffer_options.hpp"

#include "shapebuf/log/log.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace shapebuf {

namespace {

auto read_env(const char* name) -> std::string {
#ifdef _WIN32
    std::string value;
    char* env_buf = nullptr;
    size_t env_len = 0;
    if (_dupenv_s(&env_buf, &env_len, name) == 0 && env_buf) {
        value = env_buf;
        free(env_buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
#endif
}

} // namespace

auto borrow_policy_name(BorrowPolicy policy) -> const char* {
    switch (policy) {
    case BorrowPolicy::PreferBorrow:
        return "prefer";
    case BorrowPolicy::Copy:
        return "copy";
    }
    return "unknown";
}

auto parse_borrow_policy(std::string_view s) -> std::optional<BorrowPolicy> {
    if (s == "prefer" || s == "PREFER") {
        return BorrowPolicy::PreferBorrow;
    }
    if (s == "copy" || s == "COPY") {
        return BorrowPolicy::Copy;
    }
    return std::nullopt;
}

auto CaptureOptions::from_env() -> CaptureOptions {
    CaptureOptions options;
    options.apply_env();
    return options;
}

void CaptureOptions::apply_env() {
    std::string depth = read_env("SHAPEBUF_MAX_DEPTH");
    if (!depth.empty()) {
        size_t parsed = 0;
        auto [end, ec] = std::from_chars(depth.data(), depth.data() + depth.size(), parsed);
        if (ec != std::errc() || end != depth.data() + depth.size() || parsed == 0) {
            SHAPEBUF_LOG_WARN("config", "Ignoring invalid SHAPEBUF_MAX_DEPTH='" << depth << "'");
        } else {
            max_depth = parsed;
            SHAPEBUF_LOG_DEBUG("config", "max_depth=" << max_depth << " (from environment)");
        }
    }

    std::string borrow_str = read_env("SHAPEBUF_BORROW");
    if (!borrow_str.empty()) {
        if (auto policy = parse_borrow_policy(borrow_str)) {
            borrow = *policy;
            SHAPEBUF_LOG_DEBUG("config",
                               "borrow=" << borrow_policy_name(borrow) << " (from environment)");
        } else {
            SHAPEBUF_LOG_WARN("config", "Ignoring invalid SHAPEBUF_BORROW='" << borrow_str
                                                                            << "' (expected "
                                                                               "prefer or copy)");
        }
    }
}

} // namespace shapebuf
