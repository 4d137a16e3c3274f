#include <gtest/gtest.h>

#include "io/fd.hpp"
#include "testing.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        updater::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, ReleaseTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    int released = -1;
    {
        updater::Fd holder(fd);
        released = holder.Release();
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(released, fd);
    EXPECT_EQ(::close(released), 0);
}

TEST(FdTests, MoveLeavesSourceEmpty) {
    updater::Fd a(::open("/dev/null", O_RDONLY));
    ASSERT_TRUE(a.Valid());
    const int raw = a.Get();

    updater::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), raw);

    auto r = b.CloseChecked();
    EXPECT_TRUE(r.is_ok()) << r.msg;
    EXPECT_FALSE(b.Valid());
}

TEST(FdTests, OpenDirectory) {
    testutil::TemporaryDirectory tmp;

    updater::Fd dir;
    auto ok = updater::Fd::OpenDirectory(tmp.Path(), dir);
    ASSERT_TRUE(ok.is_ok()) << ok.msg;
    EXPECT_TRUE(dir.Valid());

    updater::Fd missing;
    auto bad = updater::Fd::OpenDirectory(tmp.File("nope"), missing);
    EXPECT_FALSE(bad.is_ok());
    EXPECT_EQ(bad.err, ENOENT);
    EXPECT_FALSE(missing.Valid());
}

} // namespace
