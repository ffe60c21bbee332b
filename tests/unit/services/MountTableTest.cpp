/**
 * @file MountTableTest.cpp
 * @brief Unit tests for mount table parsing and device matching
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "services/MountTable.hpp"

#include <fstream>

class MountTableTest : public FileTestFixture {
protected:
    std::filesystem::path WriteMounts(const std::string& content) {
        const auto file = temp->path() / "mounts";
        std::ofstream out{file};
        out << content;
        return file;
    }
};

TEST_F(MountTableTest, Entries_ParsesMountsFile) {
    const auto mounts = WriteMounts("/dev/sda2 / ext4 rw,relatime 0 0\n"
                                    "/dev/sdb1 /mnt/usb vfat rw 0 0\n");
    MountTable table{mounts.string(), (temp->path() / "sys").string()};

    const auto entries = table.entries();

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].device, "/dev/sda2");
    EXPECT_EQ(entries[0].mount_point, "/");
    EXPECT_EQ(entries[1].mount_point, "/mnt/usb");
    EXPECT_EQ(entries[1].filesystem, "vfat");
}

TEST_F(MountTableTest, Entries_MissingFileIsEmpty) {
    MountTable table{(temp->path() / "absent").string(), (temp->path() / "sys").string()};
    EXPECT_TRUE(table.entries().empty());
}

TEST_F(MountTableTest, DmHolders_CollectsDeviceAndPartitionHolders) {
    const auto sys = temp->path() / "sys";
    std::filesystem::create_directories(sys / "sdb" / "holders" / "dm-0");
    std::filesystem::create_directories(sys / "sdb" / "sdb1" / "holders" / "dm-3");
    std::filesystem::create_directories(sys / "sdb" / "queue");
    MountTable table{(temp->path() / "mounts").string(), sys.string()};

    auto holders = table.dm_holders("/dev/sdb");
    std::ranges::sort(holders);

    EXPECT_EQ(holders, (std::vector<std::string>{"dm-0", "dm-3"}));
}

TEST_F(MountTableTest, DmHolders_UnknownDeviceIsEmpty) {
    MountTable table{(temp->path() / "mounts").string(), (temp->path() / "sys").string()};
    EXPECT_TRUE(table.dm_holders("/dev/sdz").empty());
}

TEST(MountMatchingTest, FindMount_MatchesWholeDevice) {
    const std::vector<MountEntry> entries{{"/dev/sdb", "/data", "ext4"}};
    auto mount = mounts::find_mount_for_device(entries, "/dev/sdb", {});
    ASSERT_TRUE(mount.has_value());
    EXPECT_EQ(mount->mount_point, "/data");
}

TEST(MountMatchingTest, FindMount_MatchesPartitions) {
    const std::vector<MountEntry> entries{{"/dev/sdb1", "/a", "ext4"},
                                          {"/dev/nvme0n1p2", "/b", "xfs"}};
    EXPECT_TRUE(mounts::find_mount_for_device(entries, "/dev/sdb", {}).has_value());
    EXPECT_TRUE(mounts::find_mount_for_device(entries, "/dev/nvme0n1", {}).has_value());
}

TEST(MountMatchingTest, FindMount_IgnoresOtherDevicesWithSamePrefix) {
    const std::vector<MountEntry> entries{{"/dev/sdbb1", "/a", "ext4"}};
    EXPECT_FALSE(mounts::find_mount_for_device(entries, "/dev/sdb", {}).has_value());
}

TEST(MountMatchingTest, FindMount_MatchesDeviceMapperHolder) {
    const std::vector<MountEntry> entries{{"/dev/dm-0", "/home", "ext4"}};
    EXPECT_FALSE(mounts::find_mount_for_device(entries, "/dev/sdc", {}).has_value());
    EXPECT_TRUE(mounts::find_mount_for_device(entries, "/dev/sdc", {"dm-0"}).has_value());
}

TEST(MountMatchingTest, IsMountPoint_ComparesNormalizedPaths) {
    const std::vector<MountEntry> entries{{"/dev/sdb1", "/mnt/usb", "vfat"}};
    EXPECT_TRUE(mounts::is_mount_point(entries, "/mnt/usb"));
    EXPECT_TRUE(mounts::is_mount_point(entries, "/mnt/./usb"));
    EXPECT_FALSE(mounts::is_mount_point(entries, "/mnt/usb/file"));
}
