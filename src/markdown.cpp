/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "markdown.hpp"

#include "file_io.hpp"
#include "link_resolver.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <format>
#include <map>
#include <stdexcept>

#include <md4c.h>

namespace rendar {

namespace {

constexpr unsigned kParserFlags = MD_DIALECT_GITHUB | MD_FLAG_LATEXMATHSPANS;

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// --- Helpers ---

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);
  return text;
}

std::string_view trimLineEnd(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.remove_suffix(1);
  return line;
}

std::string_view trimQuotes(std::string_view text) {
  while (!text.empty() && (text.front() == '"' || text.front() == '\''))
    text.remove_prefix(1);
  while (!text.empty() && (text.back() == '"' || text.back() == '\''))
    text.remove_suffix(1);
  return text;
}

void appendUtf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

/**
 * @brief Decodes an entity such as `&amp;` or `&#x41;`. Unknown named
 * entities are returned unchanged.
 */
std::string decodeEntity(std::string_view entity) {
  if (entity.size() < 3 || entity.front() != '&' || entity.back() != ';')
    return std::string(entity);
  std::string_view name = entity.substr(1, entity.size() - 2);

  if (name.starts_with('#')) {
    std::string_view digits = name.substr(1);
    int base = 10;
    if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
      base = 16;
      digits.remove_prefix(1);
    }
    std::uint32_t cp = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
    if (ec != std::errc() || ptr != digits.data() + digits.size() || cp == 0 ||
        cp > 0x10FFFF)
      return std::string(kReplacementChar);
    std::string out;
    appendUtf8(out, cp);
    return out;
  }

  static const std::map<std::string_view, std::string_view> named = {
      {"amp", "&"},           {"lt", "<"},
      {"gt", ">"},            {"quot", "\""},
      {"apos", "'"},          {"nbsp", "\xC2\xA0"},
      {"copy", "\xC2\xA9"},   {"reg", "\xC2\xAE"},
      {"mdash", "\xE2\x80\x94"}, {"ndash", "\xE2\x80\x93"},
      {"hellip", "\xE2\x80\xA6"}};
  auto it = named.find(name);
  return it != named.end() ? std::string(it->second) : std::string(entity);
}

/// Flattens an md4c attribute into plain text, decoding entities.
std::string attributeText(const MD_ATTRIBUTE &attr) {
  if (attr.size == 0)
    return {};
  if (attr.substr_offsets == nullptr || attr.substr_types == nullptr)
    return std::string(attr.text, attr.size);

  std::string text;
  for (int i = 0; attr.substr_offsets[i] < attr.size; ++i) {
    MD_OFFSET begin = attr.substr_offsets[i];
    MD_OFFSET end = attr.substr_offsets[i + 1];
    std::string_view part(attr.text + begin, end - begin);
    switch (attr.substr_types[i]) {
    case MD_TEXT_NULLCHAR:
      text += kReplacementChar;
      break;
    case MD_TEXT_ENTITY:
      text += decodeEntity(part);
      break;
    default:
      text += part;
    }
  }
  return text;
}

/// Percent-encodes what does not belong in a URL and escapes `&`.
std::string escapeUrl(std::string_view url) {
  static constexpr std::string_view kSafe = "-_.~!*'();:@=+$,/?#[]%";
  std::string out;
  out.reserve(url.size());
  for (char ch : url) {
    auto byte = static_cast<unsigned char>(ch);
    if (std::isalnum(byte) || kSafe.find(ch) != std::string_view::npos)
      out += ch;
    else if (ch == '&')
      out += "&amp;";
    else
      out += std::format("%{:02X}", static_cast<unsigned>(byte));
  }
  return out;
}

// --- Renderer ---

/**
 * @brief Builds HTML from md4c's callback stream.
 *
 * In slide mode every H1 after the first starts a new output chunk, so the
 * caller gets one chunk per slide.
 */
class HtmlRenderer {
public:
  HtmlRenderer(const LinkRewriter &rewriteLink, bool splitSlides)
      : rewriteLink_(rewriteLink), splitSlides_(splitSlides) {
    chunks_.emplace_back();
  }

  void render(std::string_view markdown) {
    MD_PARSER parser{};
    parser.abi_version = 0;
    parser.flags = kParserFlags;
    parser.enter_block = &HtmlRenderer::enterBlock;
    parser.leave_block = &HtmlRenderer::leaveBlock;
    parser.enter_span = &HtmlRenderer::enterSpan;
    parser.leave_span = &HtmlRenderer::leaveSpan;
    parser.text = &HtmlRenderer::onText;

    int ret = md_parse(markdown.data(), static_cast<MD_SIZE>(markdown.size()),
                       &parser, this);
    if (ret != 0)
      throw std::runtime_error("Markdown parsing failed.");
  }

  std::vector<std::string> takeChunks() { return std::move(chunks_); }

private:
  std::string &out() { return chunks_.back(); }

  static int enterBlock(MD_BLOCKTYPE type, void *detail, void *userdata) {
    static_cast<HtmlRenderer *>(userdata)->openBlock(type, detail);
    return 0;
  }
  static int leaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata) {
    static_cast<HtmlRenderer *>(userdata)->closeBlock(type, detail);
    return 0;
  }
  static int enterSpan(MD_SPANTYPE type, void *detail, void *userdata) {
    static_cast<HtmlRenderer *>(userdata)->openSpan(type, detail);
    return 0;
  }
  static int leaveSpan(MD_SPANTYPE type, void *detail, void *userdata) {
    static_cast<HtmlRenderer *>(userdata)->closeSpan(type, detail);
    return 0;
  }
  static int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                    void *userdata) {
    static_cast<HtmlRenderer *>(userdata)->writeText(
        type, std::string_view(text, size));
    return 0;
  }

  static const char *alignAttribute(MD_ALIGN align) {
    switch (align) {
    case MD_ALIGN_LEFT:
      return " align=\"left\"";
    case MD_ALIGN_CENTER:
      return " align=\"center\"";
    case MD_ALIGN_RIGHT:
      return " align=\"right\"";
    default:
      return "";
    }
  }

  void openBlock(MD_BLOCKTYPE type, void *detail) {
    switch (type) {
    case MD_BLOCK_DOC:
    case MD_BLOCK_HTML:
      break;
    case MD_BLOCK_QUOTE:
      out() += "<blockquote>\n";
      break;
    case MD_BLOCK_UL:
      out() += "<ul>\n";
      break;
    case MD_BLOCK_OL: {
      auto *ol = static_cast<MD_BLOCK_OL_DETAIL *>(detail);
      if (ol->start == 1)
        out() += "<ol>\n";
      else
        out() += std::format("<ol start=\"{}\">\n", ol->start);
      break;
    }
    case MD_BLOCK_LI: {
      auto *li = static_cast<MD_BLOCK_LI_DETAIL *>(detail);
      if (li->is_task) {
        bool checked = li->task_mark == 'x' || li->task_mark == 'X';
        out() += "<li class=\"task-list-item\"><input type=\"checkbox\" "
                 "class=\"task-list-item-checkbox\" disabled";
        out() += checked ? " checked>" : ">";
      } else {
        out() += "<li>";
      }
      break;
    }
    case MD_BLOCK_HR:
      out() += "<hr>\n";
      break;
    case MD_BLOCK_H: {
      auto *h = static_cast<MD_BLOCK_H_DETAIL *>(detail);
      if (splitSlides_ && h->level == 1) {
        if (!seenH1_)
          seenH1_ = true;
        else if (!out().empty())
          chunks_.emplace_back();
      }
      out() += std::format("<h{}>", h->level);
      break;
    }
    case MD_BLOCK_CODE: {
      auto *code = static_cast<MD_BLOCK_CODE_DETAIL *>(detail);
      std::string lang = attributeText(code->lang);
      if (lang.empty())
        out() += "<pre><code>";
      else
        out() += std::format("<pre><code class=\"language-{}\">",
                             escapeHtml(lang));
      break;
    }
    case MD_BLOCK_P:
      out() += "<p>";
      break;
    case MD_BLOCK_TABLE:
      out() += "<table>\n";
      break;
    case MD_BLOCK_THEAD:
      out() += "<thead>\n";
      break;
    case MD_BLOCK_TBODY:
      out() += "<tbody>\n";
      break;
    case MD_BLOCK_TR:
      out() += "<tr>\n";
      break;
    case MD_BLOCK_TH:
      out() += "<th";
      out() += alignAttribute(static_cast<MD_BLOCK_TD_DETAIL *>(detail)->align);
      out() += ">";
      break;
    case MD_BLOCK_TD:
      out() += "<td";
      out() += alignAttribute(static_cast<MD_BLOCK_TD_DETAIL *>(detail)->align);
      out() += ">";
      break;
    }
  }

  void closeBlock(MD_BLOCKTYPE type, void *detail) {
    switch (type) {
    case MD_BLOCK_DOC:
    case MD_BLOCK_HTML:
    case MD_BLOCK_HR:
      break;
    case MD_BLOCK_QUOTE:
      out() += "</blockquote>\n";
      break;
    case MD_BLOCK_UL:
      out() += "</ul>\n";
      break;
    case MD_BLOCK_OL:
      out() += "</ol>\n";
      break;
    case MD_BLOCK_LI:
      out() += "</li>\n";
      break;
    case MD_BLOCK_H:
      out() += std::format("</h{}>\n",
                           static_cast<MD_BLOCK_H_DETAIL *>(detail)->level);
      break;
    case MD_BLOCK_CODE:
      out() += "</code></pre>\n";
      break;
    case MD_BLOCK_P:
      out() += "</p>\n";
      break;
    case MD_BLOCK_TABLE:
      out() += "</table>\n";
      break;
    case MD_BLOCK_THEAD:
      out() += "</thead>\n";
      break;
    case MD_BLOCK_TBODY:
      out() += "</tbody>\n";
      break;
    case MD_BLOCK_TR:
      out() += "</tr>\n";
      break;
    case MD_BLOCK_TH:
      out() += "</th>\n";
      break;
    case MD_BLOCK_TD:
      out() += "</td>\n";
      break;
    }
  }

  void openSpan(MD_SPANTYPE type, void *detail) {
    // Tags are not allowed inside an alt attribute; only nesting is tracked.
    if (imageNesting_ > 0) {
      if (type == MD_SPAN_IMG)
        ++imageNesting_;
      return;
    }

    switch (type) {
    case MD_SPAN_EM:
      out() += "<em>";
      break;
    case MD_SPAN_STRONG:
      out() += "<strong>";
      break;
    case MD_SPAN_U:
      out() += "<u>";
      break;
    case MD_SPAN_DEL:
      out() += "<del>";
      break;
    case MD_SPAN_CODE:
      out() += "<code>";
      break;
    case MD_SPAN_LATEXMATH:
      out() += "<x-equation>";
      break;
    case MD_SPAN_LATEXMATH_DISPLAY:
      out() += "<x-equation type=\"display\">";
      break;
    case MD_SPAN_A: {
      auto *a = static_cast<MD_SPAN_A_DETAIL *>(detail);
      std::string href = rewriteLink_(attributeText(a->href));
      out() += std::format("<a href=\"{}\"", escapeUrl(href));
      std::string title = attributeText(a->title);
      if (!title.empty())
        out() += std::format(" title=\"{}\"", escapeHtml(title));
      out() += ">";
      break;
    }
    case MD_SPAN_IMG: {
      auto *img = static_cast<MD_SPAN_IMG_DETAIL *>(detail);
      out() += std::format("<img src=\"{}\" alt=\"",
                           escapeUrl(attributeText(img->src)));
      ++imageNesting_;
      break;
    }
    case MD_SPAN_WIKILINK: {
      auto *wiki = static_cast<MD_SPAN_WIKILINK_DETAIL *>(detail);
      out() += std::format("<x-wikilink data-target=\"{}\">",
                           escapeHtml(attributeText(wiki->target)));
      break;
    }
    }
  }

  void closeSpan(MD_SPANTYPE type, void *detail) {
    if (imageNesting_ > 0) {
      if (type == MD_SPAN_IMG) {
        --imageNesting_;
        if (imageNesting_ == 0) {
          auto *img = static_cast<MD_SPAN_IMG_DETAIL *>(detail);
          out() += "\"";
          std::string title = attributeText(img->title);
          if (!title.empty())
            out() += std::format(" title=\"{}\"", escapeHtml(title));
          out() += ">";
        }
      }
      return;
    }

    switch (type) {
    case MD_SPAN_EM:
      out() += "</em>";
      break;
    case MD_SPAN_STRONG:
      out() += "</strong>";
      break;
    case MD_SPAN_U:
      out() += "</u>";
      break;
    case MD_SPAN_DEL:
      out() += "</del>";
      break;
    case MD_SPAN_CODE:
      out() += "</code>";
      break;
    case MD_SPAN_LATEXMATH:
    case MD_SPAN_LATEXMATH_DISPLAY:
      out() += "</x-equation>";
      break;
    case MD_SPAN_A:
      out() += "</a>";
      break;
    case MD_SPAN_WIKILINK:
      out() += "</x-wikilink>";
      break;
    case MD_SPAN_IMG:
      break;
    }
  }

  void writeText(MD_TEXTTYPE type, std::string_view text) {
    switch (type) {
    case MD_TEXT_NULLCHAR:
      out() += kReplacementChar;
      break;
    case MD_TEXT_BR:
      out() += imageNesting_ > 0 ? " " : "<br>\n";
      break;
    case MD_TEXT_SOFTBR:
      out() += imageNesting_ > 0 ? " " : "\n";
      break;
    case MD_TEXT_HTML:
    case MD_TEXT_ENTITY:
      out() += text;
      break;
    default:
      out() += escapeHtml(text);
    }
  }

  const LinkRewriter &rewriteLink_;
  bool splitSlides_;
  bool seenH1_ = false;
  int imageNesting_ = 0;
  std::vector<std::string> chunks_;
};

// --- Title extraction ---

struct HeadingCollector {
  bool inHeading = false;
  std::string buffer;
  std::optional<std::string> title;

  static int enterBlock(MD_BLOCKTYPE type, void *, void *userdata) {
    auto *self = static_cast<HeadingCollector *>(userdata);
    if (type == MD_BLOCK_H) {
      self->inHeading = true;
      self->buffer.clear();
    }
    return 0;
  }

  static int leaveBlock(MD_BLOCKTYPE type, void *, void *userdata) {
    auto *self = static_cast<HeadingCollector *>(userdata);
    if (type != MD_BLOCK_H || !self->inHeading)
      return 0;
    self->inHeading = false;
    std::string_view trimmed = trim(self->buffer);
    if (trimmed.empty())
      return 0;
    self->title = std::string(trimmed);
    // Non-zero stops the parser: the first title is all we need.
    return 1;
  }

  static int noSpan(MD_SPANTYPE, void *, void *) { return 0; }

  static int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                    void *userdata) {
    auto *self = static_cast<HeadingCollector *>(userdata);
    if (!self->inHeading)
      return 0;
    std::string_view chunk(text, size);
    switch (type) {
    case MD_TEXT_BR:
    case MD_TEXT_SOFTBR:
      self->buffer += ' ';
      break;
    case MD_TEXT_ENTITY:
      self->buffer += decodeEntity(chunk);
      break;
    case MD_TEXT_NULLCHAR:
      self->buffer += kReplacementChar;
      break;
    case MD_TEXT_HTML:
      break;
    default:
      self->buffer += chunk;
    }
    return 0;
  }
};

std::string slidesFromChunks(const std::vector<std::string> &chunks) {
  std::size_t count = chunks.empty() ? 1 : chunks.size();
  std::string html = std::format(
      "<div class=\"slides-root\" data-slide-count=\"{}\" tabindex=\"0\">",
      count);
  for (std::size_t i = 0; i < count; ++i) {
    std::string body = i < chunks.size() ? rewriteMermaidBlocks(chunks[i]) : "";
    if (i == 0)
      html += "<section class=\"slide is-active\" id=\"slide-1\" "
              "data-slide=\"1\">";
    else
      html += std::format("<section class=\"slide\" id=\"slide-{0}\" "
                          "data-slide=\"{0}\" aria-hidden=\"true\">",
                          i + 1);
    html += body;
    html += "</section>";
  }
  html += std::format("<div class=\"slides-progress\">1 / {}</div>", count);
  html += "</div>";
  return html;
}

} // namespace

std::pair<FrontMatter, std::string_view>
parseFrontMatter(std::string_view markdown) {
  FrontMatter frontMatter;

  std::size_t firstEnd = markdown.find('\n');
  std::string_view firstLine =
      firstEnd == std::string_view::npos ? markdown
                                         : markdown.substr(0, firstEnd + 1);
  if (trimLineEnd(firstLine) != "---")
    return {frontMatter, markdown};

  std::size_t offset = firstLine.size();
  std::vector<std::string_view> lines;
  std::optional<std::size_t> bodyStart;
  while (offset < markdown.size()) {
    std::size_t end = markdown.find('\n', offset);
    std::size_t next = end == std::string_view::npos ? markdown.size() : end + 1;
    std::string_view line = trimLineEnd(markdown.substr(offset, next - offset));
    if (line == "---") {
      bodyStart = next;
      break;
    }
    lines.push_back(line);
    offset = next;
  }
  if (!bodyStart)
    return {frontMatter, markdown};

  for (std::string_view raw : lines) {
    std::string_view line = trim(raw);
    if (line.empty() || line.starts_with('#'))
      continue;
    std::size_t colon = line.find(':');
    if (colon == std::string_view::npos)
      continue;
    std::string_view key = trim(line.substr(0, colon));
    if (key.empty())
      continue;
    std::string_view value = trimQuotes(trim(line.substr(colon + 1)));
    frontMatter.entries.emplace_back(std::string(key), std::string(value));
    if (key == "mode" && !value.empty())
      frontMatter.mode = toLower(value);
  }

  return {frontMatter, markdown.substr(*bodyStart)};
}

std::string markdownToHtml(std::string_view markdown,
                           const LinkRewriter &rewriteLink) {
  HtmlRenderer renderer(rewriteLink, false);
  renderer.render(markdown);
  return renderer.takeChunks().front();
}

std::string markdownToSlides(std::string_view markdown,
                             const LinkRewriter &rewriteLink) {
  HtmlRenderer renderer(rewriteLink, true);
  renderer.render(markdown);
  return slidesFromChunks(renderer.takeChunks());
}

std::optional<std::string> firstHeadingTitle(std::string_view markdown) {
  auto [frontMatter, body] = parseFrontMatter(markdown);

  HeadingCollector collector;
  MD_PARSER parser{};
  parser.abi_version = 0;
  parser.flags = kParserFlags;
  parser.enter_block = &HeadingCollector::enterBlock;
  parser.leave_block = &HeadingCollector::leaveBlock;
  parser.enter_span = &HeadingCollector::noSpan;
  parser.leave_span = &HeadingCollector::noSpan;
  parser.text = &HeadingCollector::onText;

  md_parse(body.data(), static_cast<MD_SIZE>(body.size()), &parser,
           &collector);
  return collector.title;
}

std::string rewriteMermaidBlocks(std::string_view html) {
  constexpr std::string_view openTag = "<pre><code class=\"language-mermaid\">";
  constexpr std::string_view closeTag = "</code></pre>";

  std::string output;
  output.reserve(html.size());
  std::string_view rest = html;

  while (true) {
    std::size_t start = rest.find(openTag);
    if (start == std::string_view::npos)
      break;
    output += rest.substr(0, start);
    output += "<pre class=\"mermaid\">";
    std::string_view afterOpen = rest.substr(start + openTag.size());
    std::size_t end = afterOpen.find(closeTag);
    if (end == std::string_view::npos) {
      output += afterOpen;
      rest = {};
      break;
    }
    output += afterOpen.substr(0, end);
    output += "</pre>";
    rest = afterOpen.substr(end + closeTag.size());
  }

  output += rest;
  return output;
}

std::optional<std::string> frontMatterTableHtml(const FrontMatter &frontMatter) {
  if (frontMatter.entries.empty())
    return std::nullopt;

  std::string html =
      "<table class=\"front-matter-table\"><thead><tr><th>Key</th>"
      "<th>Value</th></tr></thead><tbody>";
  for (const auto &[key, value] : frontMatter.entries)
    html += std::format("<tr><td>{}</td><td>{}</td></tr>", escapeHtml(key),
                        escapeHtml(value));
  html += "</tbody></table>";
  return html;
}

RenderedPage renderMarkdownFile(const fs::path &inputRoot,
                                const fs::path &sourceRel,
                                const DirSet &indexDirs) {
  std::string markdown;
  try {
    markdown = readFile(inputRoot / sourceRel);
  } catch (const std::runtime_error &) {
    throw std::runtime_error(
        std::format("Failed to read markdown file {}",
                    (inputRoot / sourceRel).string()));
  }
  auto [frontMatter, body] = parseFrontMatter(markdown);

  RenderedPage page;
  LinkContext context{inputRoot, sourceRel, indexDirs};
  LinkRewriter rewrite = [&](std::string_view dest) {
    RewrittenLink link = rewriteLinkDestination(dest, context);
    if (link.warning)
      page.warnings.push_back(std::move(*link.warning));
    return link.destination;
  };

  if (frontMatter.isSlides()) {
    page.html = markdownToSlides(body, rewrite);
    page.mode = DocMode::Slides;
    return page;
  }

  std::string html = rewriteMermaidBlocks(markdownToHtml(body, rewrite));
  if (auto table = frontMatterTableHtml(frontMatter))
    html = *table + html;
  page.html = std::move(html);
  page.mode = DocMode::Document;
  return page;
}

} // namespace rendar
