// SPDX-FileCopyrightText: Copyright 2026 Drops Authors
// SPDX-License-Identifier: MIT
#include "gui_image.hh"

#include <include/core/SkBlendMode.h>
#include <include/core/SkColorFilter.h>
#include <include/core/SkSamplingOptions.h>

#include <algorithm>

using namespace std;

namespace drops::ui {

Image::Image(Widget* parent, sk_sp<SkImage> image, Optional<SkColor> tint)
    : Widget(parent), image(std::move(image)), tint(tint) {}

void Image::SizeChanged() { corner_radius = PillRadius(size); }

Vec2 Image::PreferredSize(float max_width) const {
  if (image == nullptr) {
    return Vec2(0, 0);
  }
  Vec2 natural(image->width(), image->height());
  if (natural.width > max_width && natural.width > 0) {
    return natural * (max_width / natural.width);
  }
  return natural;
}

SkRRect Image::RRect() const {
  return SkRRect::MakeRectXY(Bounds().sk, corner_radius, corner_radius);
}

SkPath Image::Shape() const { return SkPath::RRect(RRect()); }

Rect Image::ImageRect() const {
  if (image == nullptr || image->width() == 0 || image->height() == 0) {
    return Bounds();
  }
  float scale = min(size.width / image->width(), size.height / image->height());
  Vec2 image_size = Vec2(image->width(), image->height()) * scale;
  Vec2 origin = (size - image_size) / 2;
  return Rect::MakeOriginSize(origin, image_size);
}

void Image::Draw(SkCanvas& canvas) const {
  if (image == nullptr) {
    return;
  }
  SkPaint paint;
  paint.setAntiAlias(true);
  if (tint) {
    paint.setColorFilter(SkColorFilters::Blend(*tint, SkBlendMode::kSrcIn));
  }
  canvas.save();
  canvas.clipRRect(RRect(), true);
  canvas.drawImageRect(image, ImageRect().sk, SkSamplingOptions(SkFilterMode::kLinear), &paint);
  canvas.restore();
}

}  // namespace drops::ui
