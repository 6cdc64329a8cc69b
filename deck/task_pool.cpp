#include "task_pool.hpp"
#include "../lib/log.h"
#include <cerrno>
#include <cstdlib>
#include <ctime>

namespace deck {

static bool pool_idle(const TaskPool* pool) {
    return pool->busy == 0 && !pool->first;
}

static void* worker_main(void* arg) {
    TaskPool* pool = (TaskPool*)arg;

    pthread_mutex_lock(&pool->lock);
    for (;;) {
        while (!pool->first && !pool->closed) {
            pthread_cond_wait(&pool->job_ready, &pool->lock);
        }
        PoolJob* job = pool->first;
        if (!job) break;  // closed and nothing left
        pool->first = job->next;
        if (!pool->first) pool->last = NULL;
        pool->busy++;
        pthread_mutex_unlock(&pool->lock);

        job->run(job->data);
        free(job);

        pthread_mutex_lock(&pool->lock);
        pool->busy--;
        if (pool_idle(pool)) pthread_cond_broadcast(&pool->drained);
    }
    pthread_mutex_unlock(&pool->lock);
    return NULL;
}

// wakes every worker so they drain the queue and exit
static void close_pool(TaskPool* pool) {
    pthread_mutex_lock(&pool->lock);
    pool->closed = true;
    pthread_cond_broadcast(&pool->job_ready);
    pthread_mutex_unlock(&pool->lock);
}

static void release_pool(TaskPool* pool, int started) {
    for (int i = 0; i < started; i++) pthread_join(pool->workers[i], NULL);
    free(pool->workers);
    pthread_cond_destroy(&pool->drained);
    pthread_cond_destroy(&pool->job_ready);
    pthread_mutex_destroy(&pool->lock);
    free(pool);
}

TaskPool* task_pool_create(int worker_count) {
    if (worker_count <= 0) worker_count = TASK_POOL_DEFAULT_WORKERS;

    TaskPool* pool = (TaskPool*)calloc(1, sizeof(TaskPool));
    if (!pool) return NULL;
    pool->workers = (pthread_t*)calloc(worker_count, sizeof(pthread_t));
    if (!pool->workers) {
        free(pool);
        return NULL;
    }
    pthread_mutex_init(&pool->lock, NULL);
    pthread_cond_init(&pool->job_ready, NULL);
    pthread_cond_init(&pool->drained, NULL);

    for (int i = 0; i < worker_count; i++) {
        if (pthread_create(&pool->workers[i], NULL, worker_main, pool) != 0) {
            log_error("task pool: cannot start worker %d of %d", i + 1, worker_count);
            close_pool(pool);
            release_pool(pool, i);
            return NULL;
        }
    }
    pool->worker_count = worker_count;
    log_debug("task pool: %d workers ready", worker_count);
    return pool;
}

void task_pool_destroy(TaskPool* pool) {
    if (!pool) return;
    close_pool(pool);
    release_pool(pool, pool->worker_count);
}

bool task_pool_enqueue(TaskPool* pool, TaskFunction run, void* data) {
    if (!pool || !run) return false;

    PoolJob* job = (PoolJob*)malloc(sizeof(PoolJob));
    if (!job) return false;
    job->run = run;
    job->data = data;
    job->next = NULL;

    pthread_mutex_lock(&pool->lock);
    if (pool->closed) {
        pthread_mutex_unlock(&pool->lock);
        free(job);
        return false;
    }
    if (pool->last) pool->last->next = job;
    else pool->first = job;
    pool->last = job;
    pthread_cond_signal(&pool->job_ready);
    pthread_mutex_unlock(&pool->lock);
    return true;
}

bool task_pool_wait_all(TaskPool* pool, double timeout_seconds) {
    if (!pool) return true;

    struct timespec deadline = { 0, 0 };
    if (timeout_seconds > 0) {
        clock_gettime(CLOCK_REALTIME, &deadline);
        time_t whole = (time_t)timeout_seconds;
        deadline.tv_sec += whole;
        deadline.tv_nsec += (long)((timeout_seconds - whole) * 1e9);
        if (deadline.tv_nsec >= 1000000000L) {
            deadline.tv_sec++;
            deadline.tv_nsec -= 1000000000L;
        }
    }

    bool idle = true;
    pthread_mutex_lock(&pool->lock);
    while (!pool_idle(pool)) {
        if (timeout_seconds <= 0) {
            pthread_cond_wait(&pool->drained, &pool->lock);
        } else if (pthread_cond_timedwait(&pool->drained, &pool->lock, &deadline) == ETIMEDOUT) {
            idle = pool_idle(pool);
            break;
        }
    }
    pthread_mutex_unlock(&pool->lock);
    if (!idle) log_debug("task pool: still busy after %.2fs", timeout_seconds);
    return idle;
}

void task_pool_shutdown(TaskPool* pool) {
    if (pool) close_pool(pool);
}

} // namespace deck
