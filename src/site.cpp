/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "site.hpp"

#include "file_io.hpp"
#include "markdown.hpp"
#include "navigation.hpp"
#include "site_map.hpp"
#include "slides.hpp"

#include <format>
#include <print>
#include <stdexcept>
#include <system_error>

namespace rendar {

namespace {

constexpr std::string_view kLiveReloadScript = R"JS(<script>
(function () {
  const endpoint = "/__rendar_version";
  let last = null;
  async function poll() {
    try {
      const res = await fetch(endpoint, { cache: "no-store" });
      const text = await res.text();
      if (last === null) {
        last = text;
      } else if (last !== text) {
        location.reload();
        return;
      }
    } catch (_) {}
    setTimeout(poll, 1000);
  }
  poll();
})();
</script>
)JS";

constexpr std::string_view kHeartbeatScript = R"JS(<script>
(function () {
  const endpoint = "/__rendar_heartbeat";
  function beat() {
    fetch(endpoint, { method: "POST", cache: "no-store", keepalive: true }).catch(function () {});
  }
  beat();
  setInterval(beat, 5000);
  document.addEventListener("visibilitychange", function () {
    if (document.visibilityState === "visible") {
      beat();
    }
  });
})();
</script>
)JS";

void createDirectories(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw std::runtime_error(std::format(
        "Failed to create output directory {}: {}", dir.string(), ec.message()));
}

void reportWarnings(const std::vector<std::string> &warnings,
                    std::vector<std::string> &sink) {
  for (const auto &warning : warnings) {
    std::println(stderr, "Warning: {}", warning);
    sink.push_back(warning);
  }
}

/// Page body plus the fragments it adds to the layout.
struct PageBody {
  RenderedPage rendered;
  std::string extraHead;
  std::string extraBody;
};

PageBody renderBody(const fs::path &input, const PageEntry &page,
                    const SiteMap &map, const RenderOptions &options) {
  PageBody body;
  if (isCsvFile(page.sourcePath)) {
    body.rendered.html =
        renderCsvFile(input / page.sourcePath, options.csvMaxRows);
  } else {
    body.rendered = renderMarkdownFile(input, page.sourcePath, map.indexDirs);
  }

  if (body.rendered.mode == DocMode::Slides) {
    body.extraHead = slidesExtraHead();
    body.extraBody = slidesExtraBody();
  }
  if (options.liveReload)
    body.extraBody += liveReloadScript(options.heartbeat);
  return body;
}

} // namespace

BuildReport buildSite(const fs::path &input, const fs::path &output,
                      const PageTemplate &pageTemplate,
                      const RenderOptions &options) {
  createDirectories(output);
  SiteMap map = buildSiteMap(input, options.excludes, output);

  BuildReport report;
  fs::recursive_directory_iterator it(input);
  for (auto end = fs::recursive_directory_iterator(); it != end; ++it) {
    const fs::path &path = it->path();
    bool isDir = it->is_directory();

    if ((isDir && isInside(path, output)) ||
        isExcludedPath(path, input, options.excludes)) {
      if (isDir)
        it.disable_recursion_pending();
      continue;
    }

    fs::path rel = path.lexically_relative(input).lexically_normal();
    if (isDir) {
      createDirectories(output / rel);
      continue;
    }
    if (!it->is_regular_file())
      continue;

    const PageEntry *page = isContentFile(path) ? map.find(rel) : nullptr;
    if (page == nullptr) {
      copyFile(path, output / rel);
      ++report.assets;
      continue;
    }

    PageBody body = renderBody(input, *page, map, options);
    std::string nav = navigationHtml(buildNavigation(*page, map));
    std::string crumbs = breadcrumbsHtml(buildBreadcrumbs(*page, map));
    std::string html =
        pageTemplate.render(page->title, body.rendered.html, nav, crumbs,
                            body.extraHead, body.extraBody);

    writeFile(output / page->outputPath, html);
    if (page->isReadme && !map.indexDirs.contains(page->dir()))
      writeFile(output / page->dir() / "index.html", html);
    ++report.pages;

    reportWarnings(body.rendered.warnings, report.warnings);
  }

  return report;
}

std::size_t checkSite(const fs::path &input, const ExcludeSet *excludes) {
  SiteMap map = buildSiteMap(input, excludes);

  std::vector<std::string> warnings;
  for (const auto &[sourceRel, page] : map.pagesByPath) {
    if (!isMarkdownFile(sourceRel))
      continue;
    RenderedPage rendered = renderMarkdownFile(input, sourceRel, map.indexDirs);
    reportWarnings(rendered.warnings, warnings);
  }
  return warnings.size();
}

fs::path outputRelPath(const fs::path &sourceRel, const DirSet &indexDirs) {
  fs::path dir = normalizeRelDir(sourceRel.parent_path());
  if (isReadme(sourceRel) && !indexDirs.contains(dir))
    return dir / "index.html";
  return pageOutputPath(sourceRel);
}

std::string pathToUrl(const fs::path &path) {
  std::string url;
  for (const auto &part : path.lexically_normal()) {
    std::string s = part.string();
    if (s.empty() || s == "." || s == "/" || s == "..")
      continue;
    if (!url.empty())
      url += '/';
    url += s;
  }
  return url;
}

std::string liveReloadScript(bool heartbeat) {
  std::string script(kLiveReloadScript);
  if (heartbeat)
    script += kHeartbeatScript;
  return script;
}

} // namespace rendar
