// -*- mode: c++ -*-
//
//  Copyright(C) 2009-2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__RESOURCE__HPP__
#define __UTILS__RESOURCE__HPP__ 1

// snapshot of the cpu time of this process, the wall clock and the cpu time of this thread

#include <time.h>
#include <sys/time.h>
#include <sys/resource.h>

namespace utils
{
  struct resource
  {
  public:
    resource()
    {
      struct rusage  ruse;
      struct timeval utime;

      gettimeofday(&utime, NULL);
      getrusage(RUSAGE_SELF, &ruse);

      __cpu_time = (double(ruse.ru_utime.tv_sec + ruse.ru_stime.tv_sec)
		    + 1e-6 * (ruse.ru_utime.tv_usec + ruse.ru_stime.tv_usec));
      __user_time = double(utime.tv_sec) + 1e-6 * utime.tv_usec;

#if defined CLOCK_THREAD_CPUTIME_ID
      struct timespec tspec;
      ::clock_gettime(CLOCK_THREAD_CPUTIME_ID, &tspec);

      __thread_time = double(tspec.tv_sec) + 1e-9 * tspec.tv_nsec;
#else
      __thread_time = __cpu_time;
#endif
    }

  public:
    double cpu_time() const { return __cpu_time; }
    double user_time() const { return __user_time; }
    double thread_time() const { return __thread_time; }

  private:
    double __cpu_time;
    double __user_time;
    double __thread_time;
  };
};

#endif
