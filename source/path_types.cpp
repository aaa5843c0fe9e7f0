// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_types.cpp
/// @brief Path rendering helpers.

#include <jsonb_delta/path_types.h>

namespace jsonb_delta {

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& seg : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                if (!result.empty()) {
                    result += '.';
                }
                result += v;
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, seg);
    }
    return result;
}

Path join_paths(const Path& prefix, const Path& suffix)
{
    Path result;
    result.reserve(prefix.size() + suffix.size());
    result.insert(result.end(), prefix.begin(), prefix.end());
    result.insert(result.end(), suffix.begin(), suffix.end());
    return result;
}

} // namespace jsonb_delta
