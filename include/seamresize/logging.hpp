/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <spdlog/spdlog.h>

namespace seamresize {

// Configure spdlog logging formatting and set the desired log level (default is info)
void initLogging(const spdlog::level::level_enum &level = spdlog::level::info);

} // namespace seamresize
