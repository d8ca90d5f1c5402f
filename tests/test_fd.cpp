#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        uploader::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    uploader::Fd a(fd);
    uploader::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    ASSERT_TRUE(b.Valid());
    EXPECT_EQ(b.Get(), fd);
}

TEST(FdTests, MoveAssignClosesPreviousDescriptor) {
    int first = ::open("/dev/null", O_RDONLY);
    int second = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(first, 0);
    ASSERT_GE(second, 0);

    uploader::Fd a(first);
    uploader::Fd b(second);
    a = std::move(b);

    EXPECT_FALSE(IsOpen(first));
    EXPECT_EQ(a.Get(), second);
    EXPECT_TRUE(IsOpen(second));
}

TEST(FdTests, ResetToSameDescriptorKeepsItOpen) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    uploader::Fd holder(fd);
    holder.Reset(fd);
    EXPECT_TRUE(IsOpen(fd));

    holder.Close();
    EXPECT_FALSE(holder.Valid());
    EXPECT_FALSE(IsOpen(fd));
}

} // namespace
