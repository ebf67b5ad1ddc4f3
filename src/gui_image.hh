// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <include/core/SkColor.h>
#include <include/core/SkImage.h>
#include <include/core/SkRRect.h>

#include "optional.hh"
#include "widget.hh"

namespace drops::ui {

// Image scaled to fit (preserving its aspect ratio) and clipped to a rounded shape whose corner
// radius is half of the shorter side.
struct Image : Widget {
  sk_sp<SkImage> image;
  Optional<SkColor> tint;  // when set, replaces the colors of the image (keeping its alpha)
  float corner_radius = 0;

  Image(Widget* parent, sk_sp<SkImage> image, Optional<SkColor> tint = nullopt);

  StrView Name() const override { return "Image"; }
  void SizeChanged() override;
  Vec2 PreferredSize(float max_width) const override;
  SkRRect RRect() const;
  SkPath Shape() const override;
  void Draw(SkCanvas&) const override;

  // Where the image is drawn (in local coordinates).
  Rect ImageRect() const;
};

}  // namespace drops::ui
