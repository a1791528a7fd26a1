/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "page_template.hpp"

#include "file_io.hpp"

#include <format>
#include <regex>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace rendar {

using json = nlohmann::json;

namespace {

constexpr std::string_view kBuiltInTemplate = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <title>{{ title }}</title>
  <style>
{{ style }}
  </style>
  {{ extra_head }}
</head>
<body>
  <div class="layout">
    <aside class="sidebar">
      <nav class="site-nav">
{{ nav }}
      </nav>
    </aside>
    <main class="content">
{{ breadcrumbs }}
      <article class="page">
{{ content }}
      </article>
    </main>
  </div>
  <script type="module">
    if (document.querySelector("pre.mermaid")) {
      const { default: mermaid } = await import("https://cdn.jsdelivr.net/npm/mermaid@10/dist/mermaid.esm.min.mjs");
      mermaid.initialize({ startOnLoad: true });
    }
  </script>
  {{ extra_body }}
</body>
</html>
)HTML";

constexpr std::string_view kBuiltInStyle = R"CSS(:root {
  --fg: #1f2328;
  --muted: #59636e;
  --bg: #ffffff;
  --sidebar-bg: #f6f8fa;
  --border: #d1d9e0;
  --link: #0969da;
}
* { box-sizing: border-box; }
body {
  margin: 0;
  color: var(--fg);
  background: var(--bg);
  font: 16px/1.6 -apple-system, BlinkMacSystemFont, "Segoe UI", Helvetica, Arial, sans-serif;
}
a { color: var(--link); text-decoration: none; }
a:hover { text-decoration: underline; }
.layout { display: flex; min-height: 100vh; }
.sidebar {
  flex: 0 0 260px;
  padding: 1.5rem 1rem;
  background: var(--sidebar-bg);
  border-right: 1px solid var(--border);
}
.nav-list { list-style: none; margin: 0; padding: 0; }
.nav-list li { margin: 0.25rem 0; }
.nav-list .nav-folder > a { font-weight: 600; }
.content { flex: 1; min-width: 0; padding: 1.5rem 2.5rem; max-width: 980px; }
.breadcrumbs { font-size: 0.9rem; color: var(--muted); margin-bottom: 1rem; }
.breadcrumbs ol { list-style: none; margin: 0; padding: 0; display: flex; flex-wrap: wrap; }
.breadcrumbs li + li::before { content: "/"; padding: 0 0.5rem; }
pre { background: var(--sidebar-bg); padding: 1rem; overflow-x: auto; border-radius: 6px; }
code { font-family: ui-monospace, SFMono-Regular, Menlo, Consolas, monospace; font-size: 0.9em; }
table { border-collapse: collapse; margin: 1rem 0; }
th, td { border: 1px solid var(--border); padding: 0.4rem 0.75rem; }
blockquote { margin: 0; padding: 0 1rem; color: var(--muted); border-left: 4px solid var(--border); }
img { max-width: 100%; }
.front-matter-table { font-size: 0.9rem; }
.csv-table-wrap { overflow-x: auto; }
.csv-table th[role="button"] { cursor: pointer; user-select: none; }
.csv-table th[data-sort="asc"]::after { content: " \25B2"; }
.csv-table th[data-sort="desc"]::after { content: " \25BC"; }
.csv-notice, .csv-empty { color: var(--muted); margin: 0.5rem 0; }
@media (max-width: 760px) {
  .layout { flex-direction: column; }
  .sidebar { flex-basis: auto; border-right: none; border-bottom: 1px solid var(--border); }
  .content { padding: 1rem; }
}
)CSS";

constexpr std::string_view kRequiredPlaceholders[] = {
    "title", "content", "nav", "breadcrumbs", "extra_head", "extra_body"};

} // namespace

PageTemplate PageTemplate::builtIn() {
  return PageTemplate(std::string(kBuiltInTemplate),
                      std::string(kBuiltInStyle));
}

PageTemplate PageTemplate::fromPath(const fs::path &path) {
  std::string source;
  try {
    source = readFile(path);
  } catch (const std::runtime_error &) {
    throw std::runtime_error(
        std::format("Failed to read template {}", path.string()));
  }
  try {
    return PageTemplate(std::move(source), std::string());
  } catch (const inja::InjaError &e) {
    throw std::runtime_error(
        std::format("Failed to parse template {}: {}", path.string(), e.what()));
  }
}

PageTemplate::PageTemplate(std::string source, std::string style)
    : source_(std::move(source)), style_(std::move(style)),
      template_(env_.parse(source_)) {}

PageTemplate::PageTemplate(const PageTemplate &other)
    : source_(other.source_), style_(other.style_),
      template_(env_.parse(source_)) {}

std::string PageTemplate::render(std::string_view title,
                                 std::string_view content, std::string_view nav,
                                 std::string_view breadcrumbs,
                                 std::string_view extraHead,
                                 std::string_view extraBody) const {
  json data;
  data["title"] = std::string(title);
  data["content"] = std::string(content);
  data["nav"] = std::string(nav);
  data["breadcrumbs"] = std::string(breadcrumbs);
  data["style"] = style_;
  data["extra_head"] = std::string(extraHead);
  data["extra_body"] = std::string(extraBody);
  return env_.render(template_, data);
}

std::vector<std::string> PageTemplate::missingPlaceholders() const {
  std::vector<std::string> missing;
  for (std::string_view name : kRequiredPlaceholders) {
    std::regex pattern(std::format(R"(\{{\{{\s*{}\s*\}}\}})", name));
    if (!std::regex_search(source_, pattern))
      missing.emplace_back(name);
  }
  return missing;
}

} // namespace rendar
