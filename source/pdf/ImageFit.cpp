#include "ImageFit.h"

namespace ImageFit {

static bool isDegenerate(const QSizeF& size)
{
    return !(size.width() > 0) || !(size.height() > 0);
}

QRectF cover(const QSizeF& imageSize, const QRectF& box)
{
    if (isDegenerate(imageSize) || isDegenerate(box.size())) {
        return QRectF();
    }

    const qreal imageRatio = imageSize.width() / imageSize.height();
    const qreal boxRatio = box.width() / box.height();

    if (imageRatio > boxRatio) {
        const qreal height = box.height();
        const qreal width = height * imageRatio;
        return QRectF(box.left() + (box.width() - width) / 2, box.top(), width, height);
    }

    const qreal width = box.width();
    const qreal height = width / imageRatio;
    return QRectF(box.left(), box.top() + (box.height() - height) / 2, width, height);
}

QRectF contain(const QSizeF& imageSize, const QRectF& box)
{
    if (isDegenerate(imageSize) || isDegenerate(box.size())) {
        return QRectF();
    }

    const qreal imageRatio = imageSize.width() / imageSize.height();
    const qreal boxRatio = box.width() / box.height();

    if (imageRatio > boxRatio) {
        const qreal width = box.width();
        const qreal height = width / imageRatio;
        return QRectF(box.left(), box.top() + (box.height() - height) / 2, width, height);
    }

    const qreal height = box.height();
    const qreal width = height * imageRatio;
    return QRectF(box.left() + (box.width() - width) / 2, box.top(), width, height);
}

QSizeF logoBox(Logo::Size size)
{
    switch (size) {
        case Logo::Size::S:  return QSizeF(85, 115);
        case Logo::Size::M:  return QSizeF(171, 230);
        case Logo::Size::L:  return QSizeF(256, 346);
        case Logo::Size::XL: return QSizeF(341, 461);
    }
    return QSizeF(171, 230);
}

QSizeF logoSize(const QSizeF& imageSize, Logo::Size size)
{
    if (isDegenerate(imageSize)) {
        return QSizeF();
    }

    const QSizeF maxBox = logoBox(size);
    const qreal ratio = imageSize.width() / imageSize.height();

    qreal width = maxBox.width();
    qreal height = width / ratio;
    if (height > maxBox.height()) {
        height = maxBox.height();
        width = height * ratio;
    }
    return QSizeF(width, height);
}

QPointF logoPosition(Logo::Position position, const QSizeF& logoExtent,
                     const QSizeF& pageSize, qreal padding)
{
    const qreal w = logoExtent.width();
    const qreal h = logoExtent.height();
    const qreal left = padding;
    const qreal hCenter = (pageSize.width() - w) / 2;
    const qreal right = pageSize.width() - w - padding;
    const qreal top = padding;
    const qreal vCenter = (pageSize.height() - h) / 2;
    const qreal bottom = pageSize.height() - h - padding;

    switch (position) {
        case Logo::Position::TopLeft:      return QPointF(left, top);
        case Logo::Position::TopCenter:    return QPointF(hCenter, top);
        case Logo::Position::TopRight:     return QPointF(right, top);
        case Logo::Position::CenterLeft:   return QPointF(left, vCenter);
        case Logo::Position::Center:       return QPointF(hCenter, vCenter);
        case Logo::Position::CenterRight:  return QPointF(right, vCenter);
        case Logo::Position::BottomLeft:   return QPointF(left, bottom);
        case Logo::Position::BottomCenter: return QPointF(hCenter, bottom);
        case Logo::Position::BottomRight:  return QPointF(right, bottom);
    }
    return QPointF(right, bottom);
}

} // namespace ImageFit
