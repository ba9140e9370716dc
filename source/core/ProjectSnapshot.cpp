// ============================================================================
// ProjectSnapshot - Implementation
// ============================================================================

#include "ProjectSnapshot.h"

#include <QJsonArray>
#include <QUuid>

// Bundled resources live under this prefix in the resource directory.
static const char* BUNDLED_IMAGE_PREFIX = "/images/";

// ============================================================================
// AssetReference
// ============================================================================

AssetReference AssetReference::explicitKey(const QString& key)
{
    AssetReference ref;
    if (key.isEmpty()) {
        return ref;
    }
    ref.m_kind = Kind::Explicit;
    ref.m_key = key;
    return ref;
}

AssetReference AssetReference::placeholder(DefaultAsset asset)
{
    AssetReference ref;
    ref.m_kind = Kind::Default;
    ref.m_defaultAsset = asset;
    ref.displaySource = bundledPath(asset);
    return ref;
}

void AssetReference::clear()
{
    m_kind = Kind::Empty;
    m_key.clear();
    m_defaultAsset = DefaultAsset::Background;
    displaySource.clear();
}

QString AssetReference::toManifestKey() const
{
    switch (m_kind) {
        case Kind::Explicit: return m_key;
        case Kind::Default:  return placeholderName(m_defaultAsset);
        case Kind::Empty:    break;
    }
    return QString();
}

AssetReference AssetReference::fromManifestKey(const QString& value)
{
    if (value.isEmpty()) {
        return AssetReference();
    }

    if (value == placeholderName(DefaultAsset::Background) ||
        value == bundledPath(DefaultAsset::Background)) {
        return placeholder(DefaultAsset::Background);
    }
    if (value == placeholderName(DefaultAsset::Logo) ||
        value == bundledPath(DefaultAsset::Logo)) {
        return placeholder(DefaultAsset::Logo);
    }

    // Older files may carry another bundled path; logos are the only other
    // kind of bundled picture, everything else renders as a background.
    if (value.startsWith(QLatin1String(BUNDLED_IMAGE_PREFIX))) {
        return placeholder(value.contains(QLatin1String("logo"), Qt::CaseInsensitive)
                               ? DefaultAsset::Logo : DefaultAsset::Background);
    }

    return explicitKey(value);
}

QString AssetReference::bundledPath(DefaultAsset asset)
{
    return QLatin1String(BUNDLED_IMAGE_PREFIX) + bundledFileName(asset);
}

QString AssetReference::placeholderName(DefaultAsset asset)
{
    return asset == DefaultAsset::Logo ? QStringLiteral("default-logo")
                                       : QStringLiteral("default-background");
}

QString AssetReference::bundledFileName(DefaultAsset asset)
{
    return asset == DefaultAsset::Logo ? QStringLiteral("default_logo.png")
                                       : QStringLiteral("default_BG.png");
}

bool AssetReference::operator==(const AssetReference& other) const
{
    if (m_kind != other.m_kind) {
        return false;
    }
    switch (m_kind) {
        case Kind::Explicit: return m_key == other.m_key;
        case Kind::Default:  return m_defaultAsset == other.m_defaultAsset;
        case Kind::Empty:    break;
    }
    return true;
}

// ============================================================================
// Logo
// ============================================================================

QJsonObject Logo::toJson() const
{
    QJsonObject obj;
    obj["assetKey"] = reference.toManifestKey();
    obj["position"] = positionToString(position);
    obj["size"] = sizeToString(size);
    return obj;
}

Logo Logo::fromJson(const QJsonObject& obj)
{
    Logo logo;
    logo.reference = AssetReference::fromManifestKey(obj["assetKey"].toString());
    logo.position = positionFromString(obj["position"].toString(), Position::BottomRight);
    logo.size = sizeFromString(obj["size"].toString(), Size::M);
    return logo;
}

QString Logo::positionToString(Position position)
{
    switch (position) {
        case Position::TopLeft:      return QStringLiteral("top-left");
        case Position::TopCenter:    return QStringLiteral("top-center");
        case Position::TopRight:     return QStringLiteral("top-right");
        case Position::CenterLeft:   return QStringLiteral("center-left");
        case Position::Center:       return QStringLiteral("center");
        case Position::CenterRight:  return QStringLiteral("center-right");
        case Position::BottomLeft:   return QStringLiteral("bottom-left");
        case Position::BottomCenter: return QStringLiteral("bottom-center");
        case Position::BottomRight:  return QStringLiteral("bottom-right");
    }
    return QStringLiteral("bottom-right");
}

Logo::Position Logo::positionFromString(const QString& str, Position fallback)
{
    static const Position all[] = {
        Position::TopLeft, Position::TopCenter, Position::TopRight,
        Position::CenterLeft, Position::Center, Position::CenterRight,
        Position::BottomLeft, Position::BottomCenter, Position::BottomRight
    };
    for (Position p : all) {
        if (str == positionToString(p)) {
            return p;
        }
    }
    return fallback;
}

QString Logo::sizeToString(Size size)
{
    switch (size) {
        case Size::S:  return QStringLiteral("S");
        case Size::M:  return QStringLiteral("M");
        case Size::L:  return QStringLiteral("L");
        case Size::XL: return QStringLiteral("XL");
    }
    return QStringLiteral("M");
}

Logo::Size Logo::sizeFromString(const QString& str, Size fallback)
{
    if (str == "S")  return Size::S;
    if (str == "M")  return Size::M;
    if (str == "L")  return Size::L;
    if (str == "XL") return Size::XL;
    return fallback;
}

bool Logo::operator==(const Logo& other) const
{
    return reference == other.reference
        && position == other.position
        && size == other.size;
}

// ============================================================================
// TitlePage / Panel / EndPage
// ============================================================================

static QJsonValue logoToJson(const std::optional<Logo>& logo)
{
    return logo ? QJsonValue(logo->toJson()) : QJsonValue(QJsonValue::Null);
}

static std::optional<Logo> logoFromJson(const QJsonValue& value, Logo::Position fallbackPosition)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    QJsonObject obj = value.toObject();
    Logo logo = Logo::fromJson(obj);
    logo.position = Logo::positionFromString(obj["position"].toString(), fallbackPosition);
    return logo;
}

QJsonObject TitlePage::toJson() const
{
    QJsonObject obj;
    obj["header"] = header;
    obj["subHeader"] = subHeader;
    obj["backgroundImageAssetKey"] = background.toManifestKey();
    obj["logo"] = logoToJson(logo);
    return obj;
}

TitlePage TitlePage::fromJson(const QJsonObject& obj)
{
    TitlePage page;
    page.header = obj["header"].toString();
    page.subHeader = obj["subHeader"].toString();
    page.background = AssetReference::fromManifestKey(obj["backgroundImageAssetKey"].toString());
    page.logo = logoFromJson(obj["logo"], Logo::Position::BottomRight);
    return page;
}

bool TitlePage::operator==(const TitlePage& other) const
{
    return header == other.header
        && subHeader == other.subHeader
        && background == other.background
        && logo == other.logo;
}

Panel Panel::create()
{
    Panel panel;
    panel.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    return panel;
}

QJsonObject Panel::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["imageAssetKey"] = image.toManifestKey();
    obj["script"] = script;
    return obj;
}

Panel Panel::fromJson(const QJsonObject& obj)
{
    Panel panel;
    panel.id = obj["id"].toString();
    if (panel.id.isEmpty()) {
        // Panels without an id (hand-written files) still need an identity
        panel.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    panel.image = AssetReference::fromManifestKey(obj["imageAssetKey"].toString());
    panel.script = obj["script"].toString();
    return panel;
}

bool Panel::operator==(const Panel& other) const
{
    return id == other.id && image == other.image && script == other.script;
}

QJsonObject EndPage::toJson() const
{
    QJsonObject obj;
    obj["backgroundImageAssetKey"] = background.toManifestKey();
    obj["logo"] = logoToJson(logo);
    obj["text"] = text;
    obj["showText"] = showText;
    obj["mirrorTitlePage"] = mirrorTitlePage;
    return obj;
}

EndPage EndPage::fromJson(const QJsonObject& obj)
{
    EndPage page;
    page.background = AssetReference::fromManifestKey(obj["backgroundImageAssetKey"].toString());
    page.logo = logoFromJson(obj["logo"], Logo::Position::BottomCenter);
    page.text = obj["text"].toString();
    page.showText = obj["showText"].toBool(true);
    page.mirrorTitlePage = obj["mirrorTitlePage"].toBool(true);
    return page;
}

bool EndPage::operator==(const EndPage& other) const
{
    return background == other.background
        && logo == other.logo
        && text == other.text
        && showText == other.showText
        && mirrorTitlePage == other.mirrorTitlePage;
}

// ============================================================================
// ProjectSnapshot
// ============================================================================

ProjectSnapshot ProjectSnapshot::createDefault(int panelCount)
{
    ProjectSnapshot snapshot;
    snapshot.projectTitle = fallbackTitle();

    snapshot.titlePage.header = QStringLiteral("Client Name");
    snapshot.titlePage.subHeader = QStringLiteral("Project Title\nStoryboard");
    snapshot.titlePage.background = AssetReference::placeholder(AssetReference::DefaultAsset::Background);

    Logo titleLogo;
    titleLogo.reference = AssetReference::placeholder(AssetReference::DefaultAsset::Logo);
    titleLogo.position = Logo::Position::BottomRight;
    titleLogo.size = Logo::Size::M;
    snapshot.titlePage.logo = titleLogo;

    for (int i = 0; i < panelCount; ++i) {
        snapshot.panels.append(Panel::create());
    }

    snapshot.endPage.background = AssetReference::placeholder(AssetReference::DefaultAsset::Background);
    Logo endLogo = titleLogo;
    endLogo.position = Logo::Position::BottomCenter;
    snapshot.endPage.logo = endLogo;
    snapshot.endPage.text = QStringLiteral("The End");
    snapshot.endPage.showText = true;
    snapshot.endPage.mirrorTitlePage = true;

    snapshot.logoSizesLinked = true;
    return snapshot;
}

QString ProjectSnapshot::fallbackTitle()
{
    return QStringLiteral("My Story Project");
}

QJsonObject ProjectSnapshot::toJson() const
{
    QJsonObject obj;
    obj["projectTitle"] = projectTitle;
    obj["titlePage"] = titlePage.toJson();

    QJsonArray panelArray;
    for (const Panel& panel : panels) {
        panelArray.append(panel.toJson());
    }
    obj["panels"] = panelArray;

    obj["endPage"] = endPage.toJson();
    obj["logoSizesLinked"] = logoSizesLinked;
    return obj;
}

ProjectSnapshot ProjectSnapshot::fromJson(const QJsonObject& obj)
{
    ProjectSnapshot snapshot;
    snapshot.projectTitle = obj["projectTitle"].toString();
    snapshot.titlePage = TitlePage::fromJson(obj["titlePage"].toObject());

    const QJsonArray panelArray = obj["panels"].toArray();
    for (const QJsonValue& value : panelArray) {
        if (value.isObject()) {
            snapshot.panels.append(Panel::fromJson(value.toObject()));
        }
    }

    snapshot.endPage = EndPage::fromJson(obj["endPage"].toObject());
    snapshot.logoSizesLinked = obj["logoSizesLinked"].toBool(true);
    return snapshot;
}

void ProjectSnapshot::forEachReference(const std::function<void(AssetReference&)>& fn)
{
    fn(titlePage.background);
    if (titlePage.logo) {
        fn(titlePage.logo->reference);
    }
    fn(endPage.background);
    if (endPage.logo) {
        fn(endPage.logo->reference);
    }
    for (Panel& panel : panels) {
        fn(panel.image);
    }
}

void ProjectSnapshot::visitReferences(const std::function<void(const AssetReference&)>& fn) const
{
    fn(titlePage.background);
    if (titlePage.logo) {
        fn(titlePage.logo->reference);
    }
    fn(endPage.background);
    if (endPage.logo) {
        fn(endPage.logo->reference);
    }
    for (const Panel& panel : panels) {
        fn(panel.image);
    }
}

bool ProjectSnapshot::operator==(const ProjectSnapshot& other) const
{
    return projectTitle == other.projectTitle
        && titlePage == other.titlePage
        && panels == other.panels
        && endPage == other.endPage
        && logoSizesLinked == other.logoSizesLinked;
}
