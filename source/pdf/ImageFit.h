#pragma once

// ============================================================================
// ImageFit - Geometry for placing images into boxes
// ============================================================================
// Two policies are used by the storyboard renderer:
// - cover:   fill the box completely, cropping the overflow (page backgrounds)
// - contain: fit entirely inside the box, centred on the free axis (panels)
// Logos are fitted into a fixed per-size box and anchored to one of nine
// positions on the page.
//
// All values are in page units (1 unit = 0.75 pt). Pure functions only.
// ============================================================================

#include "../core/ProjectSnapshot.h"

#include <QPointF>
#include <QRectF>
#include <QSizeF>

namespace ImageFit {

/**
 * @brief Scale an image so it covers the whole box, centred.
 *
 * Wider images (ratio > box ratio) take the box height and overflow left and
 * right; the others take the box width and overflow top and bottom. The
 * returned rect may extend past the box; callers clip to it.
 *
 * @return Target rect, or a null rect when the image size is degenerate.
 */
QRectF cover(const QSizeF& imageSize, const QRectF& box);

/**
 * @brief Scale an image so it fits entirely inside the box, centred.
 *
 * Wider images are width-constrained (letterbox bars top/bottom), the others
 * height-constrained (pillarbox bars left/right).
 *
 * @return Target rect inside box, or a null rect when the image size is degenerate.
 */
QRectF contain(const QSizeF& imageSize, const QRectF& box);

/**
 * @brief Maximum box for a logo size class (S 85×115 ... XL 341×461).
 */
QSizeF logoBox(Logo::Size size);

/**
 * @brief Logo display size: box width first, then re-fit to the box height.
 */
QSizeF logoSize(const QSizeF& imageSize, Logo::Size size);

/**
 * @brief Top-left corner of a logo of the given extent.
 * @param padding Inset from the page edges (half the page margin)
 */
QPointF logoPosition(Logo::Position position, const QSizeF& logoExtent,
                     const QSizeF& pageSize, qreal padding);

} // namespace ImageFit
