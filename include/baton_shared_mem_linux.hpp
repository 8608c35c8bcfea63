#pragma once

#include <cstddef>
#include <cstdint>

#include <baton_region.hpp>

namespace baton
{
  namespace shared_mem
  {
    /// @brief allocates/mmaps a range of bytes as a shared memory;
    /// uses memfd_* family of functions to create/open in-memory file and mmap this file.
    /// The mapping survives fork(), a child process shares it with the parent.
    /// selects the memfd_region_t constructor that adopts an existing fd
    struct from_fd_t {};
    inline constexpr from_fd_t from_fd{};

    struct memfd_region_t final
    {
      /// creates a new shared memory of region_bytes, sealed against grow/shrink
      /// @throws os::errno_error
      explicit memfd_region_t(std::size_t region_bytes);
      /// maps an existing memfd (inherited from another process), the size is taken from the file;
      /// takes ownership of fd, it is closed on failure too
      /// @throws os::errno_error
      memfd_region_t(from_fd_t, int fd);
      ~memfd_region_t();

      memfd_region_t(const memfd_region_t&) = delete;
      memfd_region_t& operator=(const memfd_region_t&) = delete;

      /// @return ptr to the first byte of a shared memory
      uint8_t* data() { return m_rptr; }
      /// @return a size in bytes of a shared memory
      std::size_t size() const { return m_bytes; }
      int fd() const { return m_fd; }

      /// @throws region::size_alignment, region::too_small, region::too_large
      region_t region() { return region_t(m_rptr, m_bytes); }

    private:
      void map();

      int m_fd = -1; /// fd of memfd
      uint8_t* m_rptr = nullptr; /// mmap shared mem ptr
      std::size_t m_bytes = 0;
    };
  }
}
