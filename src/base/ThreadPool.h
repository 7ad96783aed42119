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

#ifndef CHANSTOR_BASE_THREADPOOL_H_
#define CHANSTOR_BASE_THREADPOOL_H_

#include <stddef.h>

#include <deque>

#include "boost/function.hpp"
#include "boost/make_shared.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"

namespace CS {

namespace Threading {

typedef boost::function<void()> Task;

// Adapts a shared packaged task to a plain Task
template <typename R>
struct PackagedTaskRunner {
  boost::shared_ptr<boost::packaged_task<R> > m_task;
  explicit PackagedTaskRunner(
      const boost::shared_ptr<boost::packaged_task<R> > &task)
      : m_task(task) {}
  void operator()() { (*m_task)(); }
};

//
// Fixed size pool of worker threads consuming a FIFO task queue.
// Workers are started in constructor and joined in destructor, tasks still
// queued at that time are dropped, so a dropped SubmitCallable task leaves
// its future with a broken promise.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  size_t GetPoolSize() const { return m_poolSize; }

  // Queue a task, a prioritized one goes to the front
  void Submit(const Task &task, bool prioritized = false);

  // Submit a task and get a future of its result
  template <typename R>
  boost::unique_future<R> SubmitCallable(const boost::function<R()> &func) {
    boost::shared_ptr<boost::packaged_task<R> > task =
        boost::make_shared<boost::packaged_task<R> >(func);
    boost::unique_future<R> future = task->get_future();
    Submit(PackagedTaskRunner<R>(task));
    return boost::move(future);
  }

  // Count of the tasks waiting in queue
  size_t GetPendingTaskCount();

 private:
  void WorkerLoop();

  // Take the front task, false if queue is empty
  bool PopTask(Task *task);
  bool HasTasks();

  // Tell all workers to quit once their current task finishes
  void StopProcessing();

 private:
  size_t m_poolSize;
  bool m_stopped;
  std::deque<Task> m_tasks;
  boost::mutex m_queueLock;
  boost::condition_variable m_taskArrived;
  boost::thread_group m_workers;

  friend class ThreadPoolTest;
  friend class ThreadPoolTest_TestDroppedTaskBreaksPromise_Test;
};

}  // namespace Threading
}  // namespace CS

#endif  // CHANSTOR_BASE_THREADPOOL_H_
