#include <fcntl.h>
#include <unistd.h>
#include <sys/mman.h>

#include <baton_errors.hpp>
#include <baton_shared_mem_linux.hpp>

namespace baton::shared_mem
{

memfd_region_t::~memfd_region_t()
{
  if(m_rptr) {
    munmap(m_rptr, m_bytes);
  }
  if(m_fd != -1) {
    close(m_fd);
  }
}

memfd_region_t::memfd_region_t(std::size_t region_bytes)
  : m_bytes(region_bytes)
{
  // MFD_ALLOW_SEALING is needed to seal the size below
  m_fd = memfd_create("baton::memfd_region_t", MFD_ALLOW_SEALING);
  if(m_fd == -1) {
    throw os::errno_error(std::source_location::current(), "memfd_create");
  }

  if(ftruncate(m_fd, static_cast<off_t>(region_bytes)) == -1) {
    const int err = errno;
    close(m_fd);
    throw os::errno_error(std::source_location::current(), err, "ftruncate");
  }

  if(fcntl(m_fd, F_ADD_SEALS, F_SEAL_GROW | F_SEAL_SHRINK | F_SEAL_SEAL) == -1) {
    const int err = errno;
    close(m_fd);
    throw os::errno_error(std::source_location::current(), err, "fcntl seals");
  }

  map();
}

memfd_region_t::memfd_region_t(from_fd_t, int fd)
  : m_fd(fd)
{
  // fd exists but the size is unknown
  const auto off = lseek(m_fd, 0, SEEK_END);
  if(off == -1) {
    const int err = errno;
    close(m_fd);
    throw os::errno_error(std::source_location::current(), err, "lseek");
  }
  if(off < 1) {
    close(m_fd);
    throw os::errno_error(std::source_location::current(), EINVAL, "lseek empty shared file");
  }

  m_bytes = static_cast<std::size_t>(off);
  map();
}

void memfd_region_t::map()
{
  // NOTE: mmap adds a file reference, m_fd stays open as it may be handed over to another process
  void* rptr = mmap(NULL, m_bytes, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, 0);
  if(rptr == MAP_FAILED) {
    const int err = errno;
    close(m_fd);
    m_fd = -1;
    throw os::errno_error(std::source_location::current(), err, "mmap");
  }
  m_rptr = reinterpret_cast<uint8_t*>(rptr);
}

}
