// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include "base/ThreadPool.h"

#include "boost/bind.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace CS {

namespace Threading {

using boost::lock_guard;
using boost::mutex;
using boost::unique_lock;

// --------------------------------------------------------------------------
ThreadPool::ThreadPool(size_t poolSize)
    : m_poolSize(poolSize > 0 ? poolSize : 1), m_stopped(false) {
  for (size_t i = 0; i < m_poolSize; ++i) {
    m_workers.create_thread(
        boost::bind(boost::type<void>(), &ThreadPool::WorkerLoop, this));
  }
}

// --------------------------------------------------------------------------
ThreadPool::~ThreadPool() {
  StopProcessing();
  m_workers.join_all();

  lock_guard<mutex> lock(m_queueLock);
  m_tasks.clear();
}

// --------------------------------------------------------------------------
void ThreadPool::Submit(const Task &task, bool prioritized) {
  {
    lock_guard<mutex> lock(m_queueLock);
    if (prioritized) {
      m_tasks.push_front(task);
    } else {
      m_tasks.push_back(task);
    }
  }
  m_taskArrived.notify_one();
}

// --------------------------------------------------------------------------
size_t ThreadPool::GetPendingTaskCount() {
  lock_guard<mutex> lock(m_queueLock);
  return m_tasks.size();
}

// --------------------------------------------------------------------------
void ThreadPool::WorkerLoop() {
  while (true) {
    Task task;
    {
      unique_lock<mutex> lock(m_queueLock);
      while (!m_stopped && m_tasks.empty()) {
        m_taskArrived.wait(lock);
      }
      if (m_stopped) {
        return;
      }
      task = m_tasks.front();
      m_tasks.pop_front();
    }
    task();
  }
}

// --------------------------------------------------------------------------
bool ThreadPool::PopTask(Task *task) {
  lock_guard<mutex> lock(m_queueLock);
  if (m_tasks.empty()) {
    return false;
  }
  *task = m_tasks.front();
  m_tasks.pop_front();
  return true;
}

// --------------------------------------------------------------------------
bool ThreadPool::HasTasks() {
  lock_guard<mutex> lock(m_queueLock);
  return !m_tasks.empty();
}

// --------------------------------------------------------------------------
void ThreadPool::StopProcessing() {
  {
    lock_guard<mutex> lock(m_queueLock);
    m_stopped = true;
  }
  m_taskArrived.notify_all();
}

}  // namespace Threading
}  // namespace CS
