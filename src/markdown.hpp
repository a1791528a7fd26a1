/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file markdown.hpp
 * @brief Markdown to HTML on top of the md4c parser.
 *
 * md4c reports the document as a stream of block, span and text callbacks.
 * The renderer in markdown.cpp turns that stream into HTML. Every link
 * destination passes through a caller-supplied rewrite hook on the way.
 */

#ifndef RENDAR_MARKDOWN_HPP
#define RENDAR_MARKDOWN_HPP

#include "path_classifier.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

/**
 * @brief `key: value` header between two `---` lines at the top of a page.
 */
struct FrontMatter {
  std::optional<std::string> mode; ///< Lower-cased value of the `mode` key.
  std::vector<std::pair<std::string, std::string>> entries; ///< In order.

  bool isSlides() const { return mode && *mode == "slides"; }
};

/**
 * @brief Splits off the front matter.
 *
 * Without a well-formed block (opening `---` on the first line and a closing
 * `---` line), the front matter is empty and the body is the whole input.
 */
std::pair<FrontMatter, std::string_view>
parseFrontMatter(std::string_view markdown);

/// Receives a raw link destination and returns the one to emit.
using LinkRewriter = std::function<std::string(std::string_view)>;

/**
 * @brief Renders Markdown to HTML.
 * @throws std::runtime_error if md4c reports a failure.
 */
std::string markdownToHtml(std::string_view markdown,
                           const LinkRewriter &rewriteLink);

/**
 * @brief Renders Markdown as a slide deck, one slide per H1.
 *
 * Content before the first H1 joins the first slide. A document without any
 * H1 is a single slide.
 */
std::string markdownToSlides(std::string_view markdown,
                             const LinkRewriter &rewriteLink);

/**
 * @brief Text of the first non-empty heading, front matter skipped.
 */
std::optional<std::string> firstHeadingTitle(std::string_view markdown);

/**
 * @brief Replaces ```` ```mermaid ```` code blocks with `<pre class="mermaid">`.
 */
std::string rewriteMermaidBlocks(std::string_view html);

/**
 * @brief Key/value table for the front matter, or nothing if it is empty.
 */
std::optional<std::string> frontMatterTableHtml(const FrontMatter &frontMatter);

enum class DocMode { Document, Slides };

struct RenderedPage {
  std::string html;                  ///< Page body.
  std::vector<std::string> warnings; ///< Advisory link warnings.
  DocMode mode = DocMode::Document;
};

/**
 * @brief Reads and renders one Markdown page, rewriting its links.
 * @param inputRoot Source root.
 * @param sourceRel Page path relative to @p inputRoot.
 * @param indexDirs Directories that own an index page.
 */
RenderedPage renderMarkdownFile(const fs::path &inputRoot,
                                const fs::path &sourceRel,
                                const DirSet &indexDirs);

} // namespace rendar

#endif // RENDAR_MARKDOWN_HPP
