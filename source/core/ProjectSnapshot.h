#pragma once

// ============================================================================
// ProjectSnapshot - Structural state of a storyboard project
// ============================================================================
// A snapshot is created with default values, edited by the front end and
// handed to the engine by value for every save and export. It never holds
// image bytes: pictures are referenced by key into the AssetStore, or by a
// placeholder naming one of the bundled default resources.
//
// JSON layout (project.json inside a .tekastory package):
//   projectTitle, titlePage{...}, panels[...], endPage{...}, logoSizesLinked
// ============================================================================

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QVector>

#include <functional>
#include <optional>

/**
 * @brief Reference to an image: an AssetStore key, a bundled default, or nothing.
 *
 * The three states are kept apart structurally, so no code has to guess what
 * a string means. displaySource is a derived value filled in after a load
 * (hydration) and is never written to a manifest.
 */
class AssetReference {
public:
    enum class Kind {
        Empty,      ///< No image
        Explicit,   ///< Key into the AssetStore
        Default     ///< Bundled resource not yet materialized into the store
    };

    enum class DefaultAsset {
        Background,
        Logo
    };

    AssetReference() = default;

    static AssetReference explicitKey(const QString& key);
    static AssetReference placeholder(DefaultAsset asset);

    Kind kind() const { return m_kind; }
    bool isEmpty() const { return m_kind == Kind::Empty; }
    bool isExplicit() const { return m_kind == Kind::Explicit; }
    bool isPlaceholder() const { return m_kind == Kind::Default; }

    /// Store key (only meaningful for Kind::Explicit).
    const QString& key() const { return m_key; }

    /// Bundled resource (only meaningful for Kind::Default).
    DefaultAsset defaultAsset() const { return m_defaultAsset; }

    /// Reset to Kind::Empty and drop the display source.
    void clear();

    /**
     * @brief Encode for the manifest.
     *
     * Explicit → key, Empty → "", Default → "default-background"/"default-logo".
     */
    QString toManifestKey() const;

    /**
     * @brief Decode a manifest key.
     *
     * "default-*" names and paths under the bundled image prefix map back to
     * Kind::Default; an empty string is Kind::Empty; anything else is a key.
     */
    static AssetReference fromManifestKey(const QString& value);

    /// Bundled resource path, e.g. "/images/default_BG.png".
    static QString bundledPath(DefaultAsset asset);

    /// Reserved placeholder name, e.g. "default-background".
    static QString placeholderName(DefaultAsset asset);

    /// File name of the bundled resource (used when it is materialized).
    static QString bundledFileName(DefaultAsset asset);

    /// Structural equality; displaySource is ignored.
    bool operator==(const AssetReference& other) const;
    bool operator!=(const AssetReference& other) const { return !(*this == other); }

    QString displaySource;  ///< Render-ready source ("asset:<key>" or bundled path), never persisted

private:
    Kind m_kind = Kind::Empty;
    QString m_key;
    DefaultAsset m_defaultAsset = DefaultAsset::Background;
};

/**
 * @brief Logo placed on the title or end page.
 */
struct Logo {
    enum class Position {
        TopLeft, TopCenter, TopRight,
        CenterLeft, Center, CenterRight,
        BottomLeft, BottomCenter, BottomRight
    };

    enum class Size { S, M, L, XL };

    AssetReference reference;
    Position position = Position::BottomRight;
    Size size = Size::M;

    QJsonObject toJson() const;
    static Logo fromJson(const QJsonObject& obj);

    static QString positionToString(Position position);
    static Position positionFromString(const QString& str, Position fallback);
    static QString sizeToString(Size size);
    static Size sizeFromString(const QString& str, Size fallback);

    bool operator==(const Logo& other) const;
    bool operator!=(const Logo& other) const { return !(*this == other); }
};

struct TitlePage {
    QString header;
    QString subHeader;                  ///< Lines separated by '\n'
    AssetReference background;
    std::optional<Logo> logo;

    QJsonObject toJson() const;
    static TitlePage fromJson(const QJsonObject& obj);

    bool operator==(const TitlePage& other) const;
    bool operator!=(const TitlePage& other) const { return !(*this == other); }
};

struct Panel {
    QString id;                         ///< UUID, identity only (order is the vector order)
    AssetReference image;
    QString script;                     ///< Soft-capped at 6 lines

    static Panel create();

    QJsonObject toJson() const;
    static Panel fromJson(const QJsonObject& obj);

    bool operator==(const Panel& other) const;
    bool operator!=(const Panel& other) const { return !(*this == other); }
};

struct EndPage {
    AssetReference background;
    std::optional<Logo> logo;
    QString text;
    bool showText = true;
    bool mirrorTitlePage = true;

    QJsonObject toJson() const;
    static EndPage fromJson(const QJsonObject& obj);

    bool operator==(const EndPage& other) const;
    bool operator!=(const EndPage& other) const { return !(*this == other); }
};

/**
 * @brief The whole project as handed to the engine.
 */
struct ProjectSnapshot {
    static constexpr int DEFAULT_PANEL_COUNT = 6;
    static constexpr int MAX_SCRIPT_LINES = 6;

    QString projectTitle;
    TitlePage titlePage;
    QVector<Panel> panels;
    EndPage endPage;
    bool logoSizesLinked = true;

    /**
     * @brief Create a fresh project with the default content.
     *
     * Both backgrounds and both logos point at the bundled defaults, so a new
     * project renders and saves without any user upload.
     */
    static ProjectSnapshot createDefault(int panelCount = DEFAULT_PANEL_COUNT);

    /// Literal used when neither a project title nor a header is available.
    static QString fallbackTitle();

    QJsonObject toJson() const;
    static ProjectSnapshot fromJson(const QJsonObject& obj);

    /**
     * @brief Visit every image reference (title background, title logo,
     *        end background, end logo, panel images) in that order.
     */
    void forEachReference(const std::function<void(AssetReference&)>& fn);
    void visitReferences(const std::function<void(const AssetReference&)>& fn) const;

    bool operator==(const ProjectSnapshot& other) const;
    bool operator!=(const ProjectSnapshot& other) const { return !(*this == other); }
};
