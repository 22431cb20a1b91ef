#include "core/NavBar.h"

#include <algorithm>

#include "AppConfig.h"

namespace {

UiRect inflateWithin(const UiRect& r, uint16_t margin, const UiRect& bounds) {
  const int32_t x0 = std::max<int32_t>(r.x - margin, bounds.x);
  const int32_t y0 = std::max<int32_t>(r.y - margin, bounds.y);
  const int32_t x1 = std::min<int32_t>(r.x + r.w + margin, bounds.x + bounds.w);
  const int32_t y1 = std::min<int32_t>(r.y + r.h + margin, bounds.y + bounds.h);
  UiRect out;
  out.x = static_cast<int16_t>(x0);
  out.y = static_cast<int16_t>(y0);
  out.w = static_cast<uint16_t>(std::max<int32_t>(x1 - x0, 0));
  out.h = static_cast<uint16_t>(std::max<int32_t>(y1 - y0, 0));
  return out;
}

}  // namespace

NavBarLayout NavBarLayout::fromAppConfig(uint16_t screenWidth, uint16_t screenHeight,
                                         uint16_t barHeight) {
  NavBarLayout layout;
  layout.screenWidth = screenWidth;
  layout.screenHeight = screenHeight;
  layout.barHeight = std::min(barHeight, screenHeight);
  layout.buttonWidth = AppConfig::kNavButtonWidth;
  layout.buttonHeight = std::min(AppConfig::kNavButtonHeight, layout.barHeight);
  layout.inset = AppConfig::kNavButtonInset;
  layout.hitMargin = AppConfig::kNavHitMargin;
  return layout;
}

uint16_t NavBarLayout::top() const {
  return static_cast<uint16_t>(screenHeight - std::min(barHeight, screenHeight));
}

UiRect NavBarLayout::bar() const {
  UiRect r;
  r.x = 0;
  r.y = static_cast<int16_t>(top());
  r.w = screenWidth;
  r.h = static_cast<uint16_t>(screenHeight - top());
  return r;
}

UiRect NavBarLayout::prevButton() const {
  UiRect r;
  r.x = static_cast<int16_t>(inset);
  r.y = static_cast<int16_t>(top() + (barHeight - buttonHeight) / 2);
  r.w = buttonWidth;
  r.h = buttonHeight;
  return r;
}

UiRect NavBarLayout::nextButton() const {
  UiRect r = prevButton();
  r.x = static_cast<int16_t>(screenWidth - inset - buttonWidth);
  return r;
}

UiRect NavBarLayout::prevHitRect() const { return inflateWithin(prevButton(), hitMargin, bar()); }

UiRect NavBarLayout::nextHitRect() const { return inflateWithin(nextButton(), hitMargin, bar()); }

NavAction NavBarLayout::hitTest(uint16_t x, uint16_t y) const {
  if (y < top()) {
    return NavAction::kNone;
  }
  if (prevHitRect().contains(x, y)) {
    return NavAction::kPrev;
  }
  if (nextHitRect().contains(x, y)) {
    return NavAction::kNext;
  }
  return NavAction::kNone;
}
