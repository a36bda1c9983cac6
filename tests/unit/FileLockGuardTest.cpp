/**
 * @file FileLockGuardTest.cpp
 * @brief Unit tests for the fcntl lock guard
 */

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <usergen/util/FileLockGuard.hpp>

using namespace UserGen::detail;

class FileLockGuardTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_filelock.tmp";
        ::remove(testFile_.c_str());

        fd_ = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
        ASSERT_GE(fd_, 0);
    }

    void TearDown() override {
        if (fd_ >= 0)
            ::close(fd_);
        ::remove(testFile_.c_str());
    }

    /// Exit status of a child that tries a non-blocking exclusive lock:
    /// 0 if it got the lock, 1 if the lock was held elsewhere.
    int lockHeldAsSeenByChild() {
        pid_t pid = ::fork();
        if (pid == 0) {
            int fd = ::open(testFile_.c_str(), O_RDWR);
            struct flock fl{};
            fl.l_type = F_WRLCK;
            fl.l_whence = SEEK_SET;
            int rc = ::fcntl(fd, F_SETLK, &fl);
            ::_exit(rc == 0 ? 0 : 1);
        }
        int status = 0;
        ::waitpid(pid, &status, 0);
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

    std::string testFile_;
    int fd_ = -1;
};

TEST_F(FileLockGuardTest, DefaultHoldsNothing) {
    FileLockGuard lock;
    EXPECT_FALSE(lock.locked());
}

TEST_F(FileLockGuardTest, SharedAndExclusive) {
    std::error_code ec;
    FileLockGuard shared(fd_, FileLockGuard::Mode::Shared, ec);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(shared.locked());
    shared.unlockIgnore();

    FileLockGuard exclusive(fd_, FileLockGuard::Mode::Exclusive, ec);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(exclusive.locked());
}

TEST_F(FileLockGuardTest, InvalidFd) {
    std::error_code ec;
    FileLockGuard lock(-1, FileLockGuard::Mode::Shared, ec);
    EXPECT_EQ(ec, std::errc::bad_file_descriptor);
    EXPECT_FALSE(lock.locked());
}

TEST_F(FileLockGuardTest, ExclusiveLockVisibleToOtherProcess) {
    {
        std::error_code ec;
        FileLockGuard lock(fd_, FileLockGuard::Mode::Exclusive, ec);
        ASSERT_FALSE(ec);
        EXPECT_EQ(lockHeldAsSeenByChild(), 1);
    }
    EXPECT_EQ(lockHeldAsSeenByChild(), 0);
}

TEST_F(FileLockGuardTest, MoveKeepsLock) {
    std::error_code ec;
    FileLockGuard lock1(fd_, FileLockGuard::Mode::Exclusive, ec);
    ASSERT_TRUE(lock1.locked());

    FileLockGuard lock2;
    lock2 = std::move(lock1);
    EXPECT_FALSE(lock1.locked());
    EXPECT_TRUE(lock2.locked());
    EXPECT_EQ(lockHeldAsSeenByChild(), 1);
}
