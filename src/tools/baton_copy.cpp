#include <cstdio>
#include <iostream>
#include <iterator>
#include <vector>

#include <unistd.h>
#include <sys/wait.h>

#include <baton_config.hpp>
#include <baton_drain.hpp>
#include <baton_errors.hpp>
#include <baton_shared_mem_linux.hpp>

// copies stdin to stdout through a shared memory region:
// the parent process writes, a forked child reads
// usage: baton_copy [timeout=<ms>,size=<bytes>]   (defaults from BATON_OPTIONS)

namespace
{
  int run_reader(baton::region_t region, const baton::options_t& options)
  {
    try
    {
      const auto data = baton::read_sync(region, options);
      if(!data.empty() && std::fwrite(data.data(), 1, data.size(), stdout) != data.size()) {
        std::cerr << __FUNCTION__ << " short write to stdout" << std::endl;
        return 1;
      }
      std::fflush(stdout);
      return 0;
    }
    catch(const std::exception& e)
    {
      std::cerr << __FUNCTION__ << " " << e.what() << std::endl;
      return 1;
    }
  }

  int run_writer(baton::region_t region, const baton::options_t& options, const std::vector<uint8_t>& data)
  {
    try
    {
      const auto completed = baton::write_sync(data, region, options);
      std::cerr << __FUNCTION__ << " bytes " << completed.m_total_size << " chunks " << completed.m_total_chunks << std::endl;
      return 0;
    }
    catch(const std::exception& e)
    {
      std::cerr << __FUNCTION__ << " " << e.what() << std::endl;
      return 1;
    }
  }
}

int main(int argc, char* argv[])
{
  try
  {
    const baton::options_t options = argc > 1
      ? baton::options_from_comma_separated(argv[1])
      : baton::options_from_env();

    std::vector<uint8_t> data{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};

    baton::shared_mem::memfd_region_t memory(options.m_region_bytes);
    const auto region = memory.region();

    std::cout.flush();
    const pid_t child = fork();
    if(child == -1) {
      throw baton::os::errno_error(std::source_location::current(), "fork");
    }
    if(child == 0) {
      _exit(run_reader(region, options));
    }

    int ret = run_writer(region, options, data);

    int status = 0;
    if(waitpid(child, &status, 0) == -1) {
      throw baton::os::errno_error(std::source_location::current(), "waitpid");
    }
    if(!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
      std::cerr << __FUNCTION__ << " reader process failed, status " << status << std::endl;
      ret = 1;
    }
    return ret;
  }
  catch(const std::exception& e)
  {
    std::cerr << __FUNCTION__ << " " << e.what() << std::endl;
    return 1;
  }
}
