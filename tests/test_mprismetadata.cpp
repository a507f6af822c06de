#include <gtest/gtest.h>

#include <QDBusError>
#include <QDBusObjectPath>
#include <QDBusVariant>

#include "backend/system/mpriscatalog.h"
#include "backend/system/mprismetadata.h"

namespace Encore {
namespace {

QVariantMap sampleMetadata()
{
    QVariantMap metadata;
    metadata["mpris:trackid"] = QVariant::fromValue(QDBusObjectPath("/org/example/Track/17"));
    metadata["xesam:title"] = "Harvest Moon";
    metadata["xesam:artist"] = QStringList{"Neil Young", "Crazy Horse"};
    metadata["xesam:album"] = "Harvest Moon";
    metadata["mpris:length"] = qlonglong(303500000);
    metadata["xesam:useCount"] = 12;
    return metadata;
}

TEST(MprisMetadataTest, ParsesPlayerMetadata)
{
    const CatalogEntry entry = Mpris::entryFromMetadata(sampleMetadata());

    EXPECT_EQ("/org/example/Track/17", entry.persistentId);
    EXPECT_EQ("Harvest Moon", entry.title);
    EXPECT_EQ("Neil Young, Crazy Horse", entry.artist);
    EXPECT_EQ("Harvest Moon", entry.album);
    EXPECT_DOUBLE_EQ(303.5, entry.durationSeconds);
    EXPECT_TRUE(entry.playCountKnown);
    EXPECT_EQ(12, entry.playCount);
}

TEST(MprisMetadataTest, UrlIsPreferredAsPersistentId)
{
    QVariantMap metadata = sampleMetadata();
    metadata["xesam:url"] = "file:///music/harvest-moon.flac";

    EXPECT_EQ("file:///music/harvest-moon.flac", Mpris::entryFromMetadata(metadata).persistentId);
}

TEST(MprisMetadataTest, WrappedValuesAreUnwrapped)
{
    QVariantMap metadata;
    metadata["mpris:trackid"] = QVariant::fromValue(QDBusVariant(
        QVariant::fromValue(QDBusObjectPath("/org/example/Track/3"))));
    metadata["xesam:title"] = QVariant::fromValue(QDBusVariant(QString("Wrapped")));
    metadata["xesam:artist"] = QVariant::fromValue(QDBusVariant(QString("Solo Artist")));

    const CatalogEntry entry = Mpris::entryFromMetadata(metadata);

    EXPECT_EQ("/org/example/Track/3", entry.persistentId);
    EXPECT_EQ("Wrapped", entry.title);
    EXPECT_EQ("Solo Artist", entry.artist);
}

TEST(MprisMetadataTest, NoTrackGivesEmptyEntry)
{
    QVariantMap metadata;
    metadata["mpris:trackid"] = QVariant::fromValue(QDBusObjectPath(Mpris::NO_TRACK_PATH));
    metadata["xesam:title"] = "Ghost";

    EXPECT_TRUE(Mpris::trackIdFromMetadata(metadata).isEmpty());
    EXPECT_FALSE(Mpris::entryFromMetadata(metadata).isValid());
    EXPECT_FALSE(Mpris::entryFromMetadata(QVariantMap()).isValid());
}

TEST(MprisMetadataTest, MissingValuesAreUnknown)
{
    QVariantMap metadata = sampleMetadata();
    metadata.remove("xesam:useCount");
    metadata.remove("mpris:length");

    const CatalogEntry entry = Mpris::entryFromMetadata(metadata);

    EXPECT_FALSE(entry.playCountKnown);
    EXPECT_DOUBLE_EQ(0.0, entry.durationSeconds);
}

TEST(MprisMetadataTest, MalformedValuesAreIgnored)
{
    QVariantMap metadata = sampleMetadata();
    metadata["xesam:useCount"] = "lots";
    metadata["mpris:length"] = qlonglong(-5);

    const CatalogEntry entry = Mpris::entryFromMetadata(metadata);

    EXPECT_FALSE(entry.playCountKnown);
    EXPECT_DOUBLE_EQ(0.0, entry.durationSeconds);
}

TEST(MprisMetadataTest, PlaybackStatusStrings)
{
    EXPECT_EQ(PlaybackSampler::Playing, Mpris::statusFromString("Playing"));
    EXPECT_EQ(PlaybackSampler::Paused, Mpris::statusFromString("Paused"));
    EXPECT_EQ(PlaybackSampler::Stopped, Mpris::statusFromString("Stopped"));
    EXPECT_EQ(PlaybackSampler::Stopped, Mpris::statusFromString(""));
}

TEST(MprisCatalogTest, DBusErrorsMapToSyncErrors)
{
    EXPECT_EQ(SyncError::None, MprisCatalog::errorFromDBus(QDBusError()));
    EXPECT_EQ(SyncError::PermissionDenied,
              MprisCatalog::errorFromDBus(QDBusError(QDBusError::AccessDenied, "denied")));
    EXPECT_EQ(SyncError::PermissionDenied,
              MprisCatalog::errorFromDBus(QDBusError(QDBusError::AuthFailed, "auth")));
    EXPECT_EQ(SyncError::CatalogUnavailable,
              MprisCatalog::errorFromDBus(QDBusError(QDBusError::ServiceUnknown, "gone")));
    EXPECT_EQ(SyncError::CatalogUnavailable,
              MprisCatalog::errorFromDBus(QDBusError(QDBusError::Timeout, "slow")));
    EXPECT_EQ(SyncError::CatalogUnavailable,
              MprisCatalog::errorFromDBus(QDBusError(QDBusError::InvalidSignature, "bad reply")));
}

} // namespace
} // namespace Encore
