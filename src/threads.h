/*
 Copyright (C) 2020 Fredrik Öhrström

 This program is free software: you can redistribute it and/or modify
 it under the terms of the GNU General Public License as published by
 the Free Software Foundation, either version 3 of the License, or
 (at your option) any later version.

 This program is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 GNU General Public License for more details.

 You should have received a copy of the GNU General Public License
 along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef THREADS_H
#define THREADS_H

#include "util.h"

#include <pthread.h>
#include <sys/types.h>
#include <unistd.h>

// The compact frame cache, the vendor quirk registry and the aes
// primitives are shared between the per device readout tasks.
// They are guarded with recursive mutexes taken through WITH.

#define WITH(mutex,func) Lock local_ ## mutex (&mutex, #func)

struct Lock;

struct RecursiveMutex
{
    RecursiveMutex(const char *name);
    ~RecursiveMutex();
    void lock();
    void unlock();

private:

    const char *name_;
    pthread_mutex_t mutex_;
    pthread_mutexattr_t attr_;
    const char *locked_in_func_;
    pid_t       locked_by_pid_;

    friend Lock;
};

struct Lock
{
    Lock(RecursiveMutex *rmutex, const char *func_name);
    ~Lock();

private:

    RecursiveMutex  *rmutex_ {};
    const char *func_name_;
};

#endif
