// task_pool.hpp - fixed-size worker pool for background renders
//
// Jobs run in the order they were queued. Closing the pool only refuses new
// jobs: everything already queued still runs, so a job's data is always
// released by its own function. Destroying the pool joins every worker.

#ifndef DECK_TASK_POOL_HPP
#define DECK_TASK_POOL_HPP

#include <pthread.h>

namespace deck {

#define TASK_POOL_DEFAULT_WORKERS 4

// the job owns its data
typedef void (*TaskFunction)(void* task_data);

typedef struct PoolJob {
    TaskFunction run;
    void* data;
    struct PoolJob* next;
} PoolJob;

typedef struct TaskPool {
    int worker_count;
    pthread_t* workers;

    PoolJob* first;             // pending jobs, oldest first
    PoolJob* last;
    int busy;                   // jobs taken by a worker and not yet finished
    bool closed;

    pthread_mutex_t lock;       // guards everything above
    pthread_cond_t job_ready;   // a job was queued or the pool closed
    pthread_cond_t drained;     // no job pending or busy
} TaskPool;

TaskPool* task_pool_create(int worker_count);
// closes the pool and joins every worker, however long their jobs take
void task_pool_destroy(TaskPool* pool);

// false once the pool is closed
bool task_pool_enqueue(TaskPool* pool, TaskFunction run, void* data);

// block until nothing is pending or busy; timeout_seconds <= 0 waits
// forever. False when the timeout passed first.
bool task_pool_wait_all(TaskPool* pool, double timeout_seconds);
void task_pool_shutdown(TaskPool* pool);

} // namespace deck

#endif // DECK_TASK_POOL_HPP
