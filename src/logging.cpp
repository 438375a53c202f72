/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include "seamresize/logging.hpp"

namespace seamresize {

void initLogging(const spdlog::level::level_enum &level) {
    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S] [%^%L%$] %v");
}

} // namespace seamresize
