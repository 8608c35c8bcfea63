#include <gtest/gtest.h>

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>
#include <sys/mman.h>

#include <baton_errors.hpp>
#include <baton_shared_mem_linux.hpp>

using namespace baton;

TEST(memfd_region, creates_zeroed_memory_of_requested_size) {
    shared_mem::memfd_region_t memory(4096);
    ASSERT_NE(memory.data(), nullptr);
    EXPECT_EQ(memory.size(), 4096u);
    EXPECT_NE(memory.fd(), -1);
    for(std::size_t i = 0; i < memory.size(); ++i) {
        ASSERT_EQ(memory.data()[i], 0) << i;
    }
}

TEST(memfd_region, region_covers_the_whole_mapping) {
    shared_mem::memfd_region_t memory(4096);
    const auto region = memory.region();
    EXPECT_EQ(region.size(), 4096u);
    EXPECT_EQ(region.chunk_capacity(), 4096 - 16);
    EXPECT_EQ(region.semaphore(), SEMAPHORE::READY);
}

TEST(memfd_region, malformed_size_is_rejected_by_region) {
    shared_mem::memfd_region_t memory(18);
    EXPECT_THROW(memory.region(), region::size_alignment);
}

TEST(memfd_region, second_mapping_of_the_same_fd_shares_bytes) {
    shared_mem::memfd_region_t memory(1024);

    // the fd ctor owns the descriptor it is given
    shared_mem::memfd_region_t other(shared_mem::from_fd, dup(memory.fd()));
    ASSERT_EQ(other.size(), 1024u);
    ASSERT_NE(other.data(), memory.data());

    memory.data()[100] = 0x42;
    EXPECT_EQ(other.data()[100], 0x42);

    other.region().publish(SEMAPHORE::HANDSHAKE);
    EXPECT_EQ(memory.region().semaphore(), SEMAPHORE::HANDSHAKE);
}

TEST(memfd_region, invalid_fd_is_rejected) {
    EXPECT_THROW(shared_mem::memfd_region_t(shared_mem::from_fd, -1), os::errno_error);
}

TEST(memfd_region, size_literal_creates_new_memory) {
    // must not be taken for a descriptor number
    shared_mem::memfd_region_t memory(3);
    EXPECT_EQ(memory.size(), 3u);
}

TEST(memfd_region, rejected_fd_is_closed) {
    const int fd = memfd_create("baton_ut_empty", 0);
    ASSERT_NE(fd, -1);

    EXPECT_THROW(shared_mem::memfd_region_t(shared_mem::from_fd, fd), os::errno_error);

    errno = 0;
    EXPECT_EQ(fcntl(fd, F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
}
