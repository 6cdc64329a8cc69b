#include "watcher.hpp"
#include "../lib/log.h"
#include "../lib/file.h"
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <sys/time.h>

namespace deck {

static log_category_t* watch_log() {
    static log_category_t* category = log_get_category("deck.watch");
    return category;
}

static std::vector<std::string> split_formats(const std::string& list) {
    std::vector<std::string> ids;
    std::string current;
    for (char c : list) {
        if (c == ',') {
            if (!current.empty()) ids.push_back(current);
            current.clear();
        } else if (c != ' ') {
            current.push_back(c);
        }
    }
    if (!current.empty()) ids.push_back(current);
    return ids;
}

struct RenderTask {
    Watcher* watcher;
    std::string path;
};

Watcher::Watcher(Pipeline* pipeline, const WatchConfig& config)
    : pipeline_(pipeline), config_(config), formats_(split_formats(config.formats)),
      pool_(task_pool_create(config.workers)), running_(false), stopping_(false), dispatched_(0) {
    pthread_mutex_init(&mutex_, NULL);
    pthread_cond_init(&wake_, NULL);
    if (!pool_) clog_error(watch_log(), "cannot create worker pool, renders run on the polling thread");
}

Watcher::~Watcher() {
    stop();
    // joins workers still busy after a timed out stop before members go away
    if (pool_) task_pool_destroy(pool_);
    pthread_cond_destroy(&wake_);
    pthread_mutex_destroy(&mutex_);
}

std::string Watcher::output_path(const std::string& source, const char* extension) const {
    size_t slash = source.find_last_of('/');
    std::string name = slash == std::string::npos ? source : source.substr(slash + 1);
    if (has_extension(name, ".dsh")) name.resize(name.size() - 4);
    return config_.output_dir + "/" + name + "." + extension;
}

bool Watcher::mark_in_flight(const std::string& path) {
    pthread_mutex_lock(&mutex_);
    bool inserted = in_flight_.insert(path).second;
    pthread_mutex_unlock(&mutex_);
    return inserted;
}

void Watcher::clear_in_flight(const std::string& path) {
    pthread_mutex_lock(&mutex_);
    in_flight_.erase(path);
    pthread_mutex_unlock(&mutex_);
}

bool Watcher::is_in_flight(const std::string& path) {
    pthread_mutex_lock(&mutex_);
    bool found = in_flight_.count(path) > 0;
    pthread_mutex_unlock(&mutex_);
    return found;
}

bool Watcher::is_stopping() {
    pthread_mutex_lock(&mutex_);
    bool stopping = stopping_;
    pthread_mutex_unlock(&mutex_);
    return stopping;
}

// ============================================================================
// Rendering
// ============================================================================

int Watcher::process_file(const std::string& path) {
    clog_info(watch_log(), "processing %s", path.c_str());
    char* content = read_text_file(path.c_str());
    if (!content) {
        clog_error(watch_log(), "cannot read %s", path.c_str());
        return 0;
    }
    std::string source(content);
    free(content);

    DeckError err;
    std::string xml;
    if (pipeline_->compile(source, &xml, &err) != DECK_OK) {
        clog_error(watch_log(), "%s: %s", path.c_str(), err.describe().c_str());
        return 0;
    }
    std::string compiled = output_path(path, "dsh.xml");
    if (!write_binary_file(compiled.c_str(), xml.data(), xml.size())) {
        clog_warn(watch_log(), "%s: cannot keep compiled document %s", path.c_str(), compiled.c_str());
    }

    int written = 0;
    for (const std::string& id : formats_) {
        if (is_stopping()) {
            clog_info(watch_log(), "shutdown in progress, skipping remaining formats of %s", path.c_str());
            break;
        }
        err.clear();
        OutputFormat format;
        if (format_from_id(id, &format, &err) != DECK_OK) {
            clog_warn(watch_log(), "%s: %s", path.c_str(), err.describe().c_str());
            continue;
        }
        std::string bytes;
        if (pipeline_->render_xml(xml, format, config_.options, &bytes, &err) != DECK_OK) {
            clog_error(watch_log(), "%s -> %s: %s", path.c_str(), id.c_str(), err.describe().c_str());
            continue;
        }
        std::string target = output_path(path, format_extension(format));
        if (!write_binary_file(target.c_str(), bytes.data(), bytes.size())) {
            clog_error(watch_log(), "%s -> %s: output: cannot write %s", path.c_str(), id.c_str(), target.c_str());
            continue;
        }
        written++;
    }
    clog_info(watch_log(), "pipeline completed for %s: %d of %zu formats written", path.c_str(),
        written, formats_.size());
    return written;
}

void Watcher::render_task(void* task_data) {
    RenderTask* task = (RenderTask*)task_data;
    if (task->watcher->is_stopping()) {
        clog_info(watch_log(), "skipping %s due to shutdown", task->path.c_str());
    } else {
        task->watcher->process_file(task->path);
    }
    task->watcher->clear_in_flight(task->path);
    delete task;
}

// ============================================================================
// Scanning
// ============================================================================

void Watcher::visit_source(const char* path, void* udata) {
    Watcher* watcher = (Watcher*)udata;
    if (watcher->is_stopping()) return;

    time_t mtime = file_mtime(path);
    if (difftime(time(NULL), mtime) > watcher->config_.freshness_window) return;
    if (!watcher->mark_in_flight(path)) return;  // already being rendered

    RenderTask* task = new RenderTask{ watcher, path };
    if (watcher->pool_ && task_pool_enqueue(watcher->pool_, render_task, task)) {
        watcher->dispatched_++;
        return;
    }
    if (!watcher->pool_) {
        render_task(task);
        watcher->dispatched_++;
        return;
    }
    // pool refused: shutting down
    watcher->clear_in_flight(task->path);
    delete task;
}

int Watcher::scan() {
    dispatched_ = 0;
    for (const std::string& root : config_.roots) {
        if (walk_files(root.c_str(), ".dsh", visit_source, this) < 0) {
            clog_warn(watch_log(), "error scanning %s", root.c_str());
        }
    }
    if (dispatched_ > 0) clog_debug(watch_log(), "scan dispatched %d render(s)", dispatched_);
    return dispatched_;
}

void* Watcher::poll_thread_func(void* arg) {
    Watcher* watcher = (Watcher*)arg;
    clog_debug(watch_log(), "poll thread started, interval %ds", watcher->config_.poll_interval);

    pthread_mutex_lock(&watcher->mutex_);
    while (!watcher->stopping_) {
        struct timeval now;
        gettimeofday(&now, NULL);
        struct timespec deadline;
        deadline.tv_sec = now.tv_sec + watcher->config_.poll_interval;
        deadline.tv_nsec = now.tv_usec * 1000;
        int rc = 0;
        while (!watcher->stopping_ && rc != ETIMEDOUT) {
            rc = pthread_cond_timedwait(&watcher->wake_, &watcher->mutex_, &deadline);
        }
        if (watcher->stopping_) break;
        pthread_mutex_unlock(&watcher->mutex_);
        watcher->scan();
        pthread_mutex_lock(&watcher->mutex_);
    }
    pthread_mutex_unlock(&watcher->mutex_);

    clog_info(watch_log(), "watch loop stopping");
    return NULL;
}

bool Watcher::start() {
    if (running_) return true;
    if (!create_dir(config_.output_dir.c_str())) {
        clog_error(watch_log(), "failed to create output directory %s", config_.output_dir.c_str());
        return false;
    }
    for (const std::string& root : config_.roots) {
        clog_info(watch_log(), "watching %s for .dsh changes", root.c_str());
    }

    scan();

    if (pthread_create(&thread_, NULL, poll_thread_func, this) != 0) {
        clog_error(watch_log(), "failed to create poll thread");
        return false;
    }
    running_ = true;
    return true;
}

bool Watcher::stop() {
    pthread_mutex_lock(&mutex_);
    bool already = stopping_;
    stopping_ = true;
    pthread_cond_broadcast(&wake_);
    pthread_mutex_unlock(&mutex_);
    if (already) return true;

    clog_info(watch_log(), "stopping file watcher and waiting for active renders");
    if (running_) {
        pthread_join(thread_, NULL);
        running_ = false;
    }
    if (!pool_) return true;

    task_pool_shutdown(pool_);
    if (task_pool_wait_all(pool_, config_.shutdown_timeout)) {
        clog_info(watch_log(), "all renders completed");
        return true;
    }
    // busy workers stay joinable; the destructor waits for them
    clog_warn(watch_log(), "timeout waiting for renders to complete after %ds, forcing shutdown",
        config_.shutdown_timeout);
    return false;
}

bool Watcher::wait_idle(double timeout_seconds) {
    if (!pool_) return true;
    return task_pool_wait_all(pool_, timeout_seconds);
}

} // namespace deck
