/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "slides.hpp"

#include <format>
#include <string_view>

namespace rendar {

namespace {

constexpr std::string_view kSlidesModeScript = R"JS(<script>
document.documentElement.classList.add("slides-mode");
</script>
)JS";

constexpr std::string_view kSlidesStyle = R"CSS(.slides-mode .sidebar,
.slides-mode .breadcrumbs {
  display: none;
}
.slides-mode .content {
  max-width: none;
  padding: 0;
}
.slides-root {
  position: relative;
  min-height: 100vh;
  outline: none;
}
.slide {
  display: none;
  min-height: 100vh;
  padding: 4rem 6rem;
  font-size: 1.4rem;
}
.slide.is-active {
  display: block;
}
.slide h1 {
  font-size: 2.6rem;
  margin-top: 0;
}
.slides-progress {
  position: fixed;
  right: 1.5rem;
  bottom: 1rem;
  font-size: 0.9rem;
  color: #59636e;
}
@media print {
  .slide {
    display: block;
    page-break-after: always;
  }
  .slides-progress {
    display: none;
  }
}
)CSS";

constexpr std::string_view kSlidesScript = R"JS(<script>
(function () {
  if (window.__rendarSlides) {
    return;
  }
  window.__rendarSlides = true;

  var slides = Array.prototype.slice.call(document.querySelectorAll(".slide"));
  if (!slides.length) {
    return;
  }
  var progress = document.querySelector(".slides-progress");
  var current = 0;

  function clamp(index) {
    return Math.max(0, Math.min(index, slides.length - 1));
  }

  function parseHash() {
    var match = window.location.hash.match(/slide-(\d+)/);
    if (!match) {
      return 0;
    }
    var value = parseInt(match[1], 10);
    return Number.isNaN(value) ? 0 : value - 1;
  }

  function show(index, updateHash) {
    var next = clamp(index);
    slides[current].classList.remove("is-active");
    slides[current].setAttribute("aria-hidden", "true");
    slides[next].classList.add("is-active");
    slides[next].removeAttribute("aria-hidden");
    current = next;
    if (progress) {
      progress.textContent = (current + 1) + " / " + slides.length;
    }
    if (updateHash) {
      var hash = "#slide-" + (current + 1);
      if (window.location.hash !== hash) {
        window.location.hash = hash;
      }
    }
  }

  function shouldIgnoreEvent(event) {
    var target = event.target;
    if (!target) {
      return false;
    }
    var tag = target.tagName ? target.tagName.toLowerCase() : "";
    return tag === "input" || tag === "textarea" || target.isContentEditable;
  }

  document.addEventListener("keydown", function (event) {
    if (event.defaultPrevented || shouldIgnoreEvent(event)) {
      return;
    }
    if (event.key === "ArrowRight" || event.key === " " || event.key === "PageDown") {
      event.preventDefault();
      show(current + 1, true);
    } else if (event.key === "ArrowLeft" || event.key === "PageUp") {
      event.preventDefault();
      show(current - 1, true);
    }
  });

  window.addEventListener("hashchange", function () {
    show(parseHash(), false);
  });

  show(parseHash(), false);
})();
</script>
)JS";

} // namespace

std::string slidesExtraHead() {
  return std::format("{}<style>\n{}</style>\n", kSlidesModeScript,
                     kSlidesStyle);
}

std::string slidesExtraBody() { return std::string(kSlidesScript); }

} // namespace rendar
