//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/random.hpp"
#include <boost/csrf/detail/except.hpp>
#include <boost/system/error_code.hpp>
#include <atomic>
#include <cerrno>

#if defined(_WIN32)
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <bcrypt.h>
#  ifdef _MSC_VER
#    pragma comment(lib, "bcrypt.lib")
#  endif
#elif defined(__linux__)
#  include <sys/random.h>
#elif defined(__APPLE__)
#  include <Security/SecRandom.h>
#else
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace boost {
namespace csrf {
namespace detail {

namespace {

[[noreturn]]
void
fail(int ev)
{
    throw_system_error(
        system::error_code(
            ev, system::system_category()));
}

#if defined(_WIN32)

void
os_random(void* buf, std::size_t n)
{
    auto* p = static_cast<PUCHAR>(buf);
    while(n > 0)
    {
        // BCryptGenRandom takes a ULONG count
        ULONG const chunk = n > 0x10000000
            ? 0x10000000
            : static_cast<ULONG>(n);
        NTSTATUS status = BCryptGenRandom(
            nullptr, p, chunk,
            BCRYPT_USE_SYSTEM_PREFERRED_RNG);
        if(! BCRYPT_SUCCESS(status))
            fail(static_cast<int>(status));
        p += chunk;
        n -= chunk;
    }
}

#elif defined(__linux__)

void
os_random(void* buf, std::size_t n)
{
    auto* p = static_cast<unsigned char*>(buf);
    while(n > 0)
    {
        ssize_t r = getrandom(p, n, 0);
        if(r < 0)
        {
            if(errno == EINTR)
                continue;
            fail(errno);
        }
        p += r;
        n -= static_cast<std::size_t>(r);
    }
}

#elif defined(__APPLE__)

void
os_random(void* buf, std::size_t n)
{
    int err = SecRandomCopyBytes(
        kSecRandomDefault, n, buf);
    if(err != errSecSuccess)
        fail(err);
}

#else

void
os_random(void* buf, std::size_t n)
{
    // opened once, never closed
    static int const fd =
        open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if(fd < 0)
        fail(errno);

    auto* p = static_cast<unsigned char*>(buf);
    while(n > 0)
    {
        ssize_t r = read(fd, p, n);
        if(r < 0)
        {
            if(errno == EINTR)
                continue;
            fail(errno);
        }
        if(r == 0)
            fail(EIO); // unexpected EOF
        p += r;
        n -= static_cast<std::size_t>(r);
    }
}

#endif

std::atomic<random_source> source_{ nullptr };

} // (anon)

void
set_random_source(random_source f) noexcept
{
    source_.store(f);
}

void
fill_random(void* buf, std::size_t n)
{
    if(auto f = source_.load())
        return f(buf, n);
    os_random(buf, n);
}

} // detail
} // csrf
} // boost
