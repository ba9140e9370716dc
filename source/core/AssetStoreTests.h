#pragma once

// ============================================================================
// AssetStore Unit Tests
// ============================================================================
// Run with: tekastory --test-assetstore
// ============================================================================

#include "AssetStore.h"

#include <QDebug>
#include <QFuture>
#include <QSet>
#include <QVector>
#include <QtConcurrent/QtConcurrent>

namespace AssetStoreTests {

/**
 * @brief Registration returns distinct keys carrying the source extension.
 */
inline bool testRegisterAndResolve()
{
    qDebug() << "=== Test: Register and Resolve ===";
    bool success = true;

    AssetStore store;
    const QByteArray first("first-bytes");
    const QByteArray second("second-bytes");

    const QString keyA = store.registerAsset(first, "photo.JPG");
    const QString keyB = store.registerAsset(first, "photo.JPG");
    const QString keyC = store.registerAsset(second, "diagram.png");

    {
        if (keyA == keyB || keyA == keyC || keyB == keyC) {
            qDebug() << "FAIL: Keys collide:" << keyA << keyB << keyC;
            success = false;
        } else {
            qDebug() << "  - Identical bytes get distinct keys: OK";
        }
    }

    {
        if (!keyA.endsWith(".JPG") || !keyC.endsWith(".png")) {
            qDebug() << "FAIL: Extension not kept:" << keyA << keyC;
            success = false;
        } else {
            qDebug() << "  - Extension kept in key: OK";
        }
    }

    {
        auto bytes = store.resolve(keyC);
        if (!bytes || *bytes != second) {
            qDebug() << "FAIL: resolve() returned wrong bytes for" << keyC;
            success = false;
        } else {
            qDebug() << "  - resolve() returns registered bytes: OK";
        }
    }

    {
        if (store.resolve("no-such-key.png").has_value()) {
            qDebug() << "FAIL: Unknown key resolved";
            success = false;
        } else {
            qDebug() << "  - Unknown key is absent: OK";
        }
    }

    {
        auto record = store.record(keyC);
        if (!record || record->mimeHint != "image/png" || record->key != keyC) {
            qDebug() << "FAIL: Wrong record for" << keyC;
            success = false;
        } else {
            qDebug() << "  - Record carries mime hint: OK";
        }
    }

    {
        if (store.count() != 3 || store.totalBytes() != first.size() * 2 + second.size()) {
            qDebug() << "FAIL: count/totalBytes mismatch:" << store.count() << store.totalBytes();
            success = false;
        } else {
            qDebug() << "  - count() and totalBytes(): OK";
        }
    }

    return success;
}

/**
 * @brief Extension and MIME rules.
 */
inline bool testExtensionRules()
{
    qDebug() << "=== Test: Extension Rules ===";
    bool success = true;

    struct Case {
        const char* name;
        const char* expected;
    };
    const Case cases[] = {
        {"picture.png", ".png"},
        {"archive.tar.gz", ".gz"},
        {"noextension", ""},
        {".hidden", ""},
        {"trailing.", ""},
        {"", ""},
    };

    for (const Case& c : cases) {
        const QString ext = AssetStore::fileExtension(QString::fromUtf8(c.name));
        if (ext != QString::fromUtf8(c.expected)) {
            qDebug() << "FAIL: fileExtension(" << c.name << ") =" << ext << "expected" << c.expected;
            success = false;
        }
    }
    if (success) {
        qDebug() << "  - fileExtension(): OK";
    }

    {
        AssetStore store;
        const QString key = store.registerAsset(QByteArray("x"), "README");
        if (key.contains('.')) {
            qDebug() << "FAIL: Key without source extension has a dot:" << key;
            success = false;
        } else {
            qDebug() << "  - Name without extension gives bare key: OK";
        }
    }

    {
        if (AssetStore::mimeHintFor("a.jpeg") != "image/jpeg"
            || AssetStore::mimeHintFor("a.png") != "image/png"
            || AssetStore::mimeHintFor("a.zzqx") != "application/octet-stream"
            || AssetStore::mimeHintFor("plain") != "application/octet-stream") {
            qDebug() << "FAIL: mimeHintFor() mismatch";
            success = false;
        } else {
            qDebug() << "  - mimeHintFor(): OK";
        }
    }

    return success;
}

/**
 * @brief put() keeps predetermined keys, clear() empties the store.
 */
inline bool testPutAndClear()
{
    qDebug() << "=== Test: Put and Clear ===";
    bool success = true;

    AssetStore store;
    store.put("abc.png", QByteArray("one"));
    store.put("abc.png", QByteArray("two"));
    store.put(QString(), QByteArray("ignored"));

    {
        auto bytes = store.resolve("abc.png");
        if (store.count() != 1 || !bytes || *bytes != QByteArray("two")) {
            qDebug() << "FAIL: put() did not replace bytes under the same key";
            success = false;
        } else {
            qDebug() << "  - put() replaces, empty key ignored: OK";
        }
    }

    {
        store.put("b.jpg", QByteArray("b"));
        const QStringList keys = store.keys();
        if (keys != QStringList({"abc.png", "b.jpg"})) {
            qDebug() << "FAIL: keys() not sorted:" << keys;
            success = false;
        } else {
            qDebug() << "  - keys() sorted: OK";
        }
    }

    {
        store.clear();
        if (store.count() != 0 || store.contains("abc.png")) {
            qDebug() << "FAIL: clear() left entries";
            success = false;
        } else {
            qDebug() << "  - clear(): OK";
        }
    }

    return success;
}

/**
 * @brief Concurrent registrations never lose or duplicate keys.
 */
inline bool testConcurrentRegistration()
{
    qDebug() << "=== Test: Concurrent Registration ===";
    bool success = true;

    AssetStore store;
    const int workers = 8;
    const int perWorker = 50;

    QVector<QFuture<QStringList>> futures;
    for (int w = 0; w < workers; ++w) {
        futures.append(QtConcurrent::run([&store, w, perWorker]() {
            QStringList keys;
            for (int i = 0; i < perWorker; ++i) {
                keys.append(store.registerAsset(QByteArray::number(w * 1000 + i),
                                                QStringLiteral("img.png")));
            }
            return keys;
        }));
    }

    QSet<QString> allKeys;
    int total = 0;
    for (QFuture<QStringList>& future : futures) {
        future.waitForFinished();
        for (const QString& key : future.result()) {
            allKeys.insert(key);
            ++total;
        }
    }

    if (total != workers * perWorker || allKeys.size() != total || store.count() != total) {
        qDebug() << "FAIL: Expected" << workers * perWorker << "distinct keys, got"
                 << allKeys.size() << "(store count" << store.count() << ")";
        success = false;
    } else {
        qDebug() << "  -" << total << "distinct keys from" << workers << "threads: OK";
    }

    return success;
}

/**
 * @brief Run all AssetStore tests.
 */
inline bool runAllTests()
{
    qDebug() << "";
    qDebug() << "========================================";
    qDebug() << "Running AssetStore Tests";
    qDebug() << "========================================";

    bool allPassed = true;

    allPassed &= testRegisterAndResolve();
    allPassed &= testExtensionRules();
    allPassed &= testPutAndClear();
    allPassed &= testConcurrentRegistration();

    qDebug() << "";
    if (allPassed) {
        qDebug() << "✅ All AssetStore tests passed!";
    } else {
        qDebug() << "❌ Some AssetStore tests failed!";
    }
    qDebug() << "";

    return allPassed;
}

} // namespace AssetStoreTests
