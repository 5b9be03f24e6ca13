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

#include "threads.h"

#include <unistd.h>
#include <stdio.h>

using namespace std;

RecursiveMutex::RecursiveMutex(const char *name)
    : name_(name), locked_in_func_(""), locked_by_pid_(0)
{
    pthread_mutexattr_init(&attr_);
    pthread_mutexattr_settype(&attr_, PTHREAD_MUTEX_RECURSIVE);
    pthread_mutex_init(&mutex_, &attr_);
}

RecursiveMutex::~RecursiveMutex()
{
    pthread_mutex_destroy(&mutex_);
    pthread_mutexattr_destroy(&attr_);
}

void RecursiveMutex::lock()
{
    pthread_mutex_lock(&mutex_);
}

void RecursiveMutex::unlock()
{
    pthread_mutex_unlock(&mutex_);
}

Lock::Lock(RecursiveMutex *rmutex, const char *func_name)
{
    rmutex_ = rmutex;
    func_name_ = func_name;
    trace("[LOCKING] %s %s (%s %d)\n", rmutex_->name_, func_name_, rmutex_->locked_in_func_, rmutex->locked_by_pid_);
    pthread_mutex_lock(&rmutex_->mutex_);
    rmutex->locked_in_func_ = func_name;
    rmutex->locked_by_pid_ = getpid();
    trace("[LOCKED]  %s %s (%s %d)\n", rmutex_->name_, func_name_, rmutex_->locked_in_func_, rmutex->locked_by_pid_);
}

Lock::~Lock()
{
    trace("[UNLOCKING] %s %s (%s %d)\n", rmutex_->name_, func_name_, rmutex_->locked_in_func_, rmutex_->locked_by_pid_);
    rmutex_->locked_in_func_ = "";
    rmutex_->locked_by_pid_ = 0;
    pthread_mutex_unlock(&rmutex_->mutex_);
    trace("[UNLOCKED]  %s %s\n", rmutex_->name_, func_name_);
}
