/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file slides.hpp
 * @brief Head and body fragments that turn a page into a slide deck.
 */

#ifndef RENDAR_SLIDES_HPP
#define RENDAR_SLIDES_HPP

#include <string>

namespace rendar {

/// Slide stylesheet plus the script marking the document as a deck.
std::string slidesExtraHead();

/// Keyboard and hash navigation between slides.
std::string slidesExtraBody();

} // namespace rendar

#endif // RENDAR_SLIDES_HPP
