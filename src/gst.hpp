#pragma once

#ifndef __GST_HPP
#define __GST_HPP

#include <map>
#include <set>
#include <mutex>
#include <chrono>
#include <atomic>
#include <string>
#include <vector>
#include <utility>
#include <exception>
#include <functional>

// gst
#include <gst/gst.h>
#include <gio/gio.h>

// logging
#include <log.hpp>
// utils
#include <utils.hpp>

namespace gst {

// safe_ptr

template<typename T> static inline void safe_ptr_addref(T* ptr) {
    if (ptr)
        g_object_ref_sink(ptr);
}

template<typename T> static inline void safe_ptr_release(T** p_ptr);

template<> inline void safe_ptr_release<GError>(GError** p_ptr) { g_clear_error(p_ptr); }
template<> inline void safe_ptr_release<GstElement>(GstElement** p_ptr) { if (p_ptr) { gst_object_unref(G_OBJECT(*p_ptr)); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GstElementFactory>(GstElementFactory** p_ptr) { if (p_ptr) { gst_object_unref(G_OBJECT(*p_ptr)); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GstCaps>(GstCaps** p_ptr) { if (p_ptr) { gst_caps_unref(*p_ptr); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GstBus>(GstBus** p_ptr) { if (p_ptr) { gst_object_unref(G_OBJECT(*p_ptr)); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GstPromise>(GstPromise** p_ptr) { if (p_ptr) { gst_promise_unref(*p_ptr); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GMainLoop>(GMainLoop** p_ptr) { if (p_ptr) { g_main_loop_unref(*p_ptr); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GMainContext>(GMainContext** p_ptr) { if (p_ptr) { g_main_context_unref(*p_ptr); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GUri>(GUri** p_ptr) { if (p_ptr) { g_uri_unref(*p_ptr); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GFile>(GFile** p_ptr) { if (p_ptr) { g_object_unref(*p_ptr); *p_ptr = nullptr; } }
template<> inline void safe_ptr_release<GFileMonitor>(GFileMonitor** p_ptr) { if (p_ptr) { g_object_unref(*p_ptr); *p_ptr = nullptr; } }

template<> inline void safe_ptr_addref<char>(char* p_ptr);  // declaration only. not defined. should not be used
template<> inline void safe_ptr_release<char>(char** p_ptr) { if (p_ptr) { g_free(*p_ptr); *p_ptr = nullptr; } }

template <typename T>
struct safe_ptr {
    inline safe_ptr() noexcept : ptr(nullptr) { }
    inline safe_ptr(T* p) : ptr(p) { }
    inline ~safe_ptr() noexcept { release(); }
    inline void release() noexcept {
        if (ptr)
            safe_ptr_release<T>(&ptr);
    }

    // no const in gst C API
    inline operator T* () noexcept { return ptr; }
    inline operator T* () const noexcept { return (T*)ptr; }

    T* get() { return ptr; }
    T* get() const { return (T*)ptr; }

    T* operator -> () const { return ptr; }
    inline operator bool () const noexcept { return ptr != nullptr; }
    inline bool operator ! () const noexcept { return ptr == nullptr; }

    T** get_ref() { return &ptr; }

    inline safe_ptr& attach(T* p) noexcept {
        release(); ptr = p; return *this;
    }
    inline T* detach() noexcept { T* p = ptr; ptr = nullptr; return p; }

    inline void swap(safe_ptr& o) noexcept { std::swap(ptr, o.ptr); }

    safe_ptr(const safe_ptr&) = delete;
    safe_ptr& operator=(const safe_ptr&) = delete;
protected:
    T* ptr;
};

inline bool element_exists(std::string const& elem_name) {
    safe_ptr<GstElementFactory> factory;
    factory.attach(gst_element_factory_find(elem_name.c_str()));
    return (bool)factory;
}

// returns a new reference or nullptr
inline GstElement* element_by_name(GstElement *pipeline, std::string const& elem_name) {
    return pipeline ? gst_bin_get_by_name(GST_BIN(pipeline), elem_name.c_str()) : nullptr;
}

// initializes gstreamer once in the whole process

struct initializer {

    static initializer& get() {
        static initializer instance;
        if (instance.is_failed)
            LOG_ERROR_FMT( "gstreamer: can't initialize" );
        return instance;
    }

    bool is_loaded() const { return !is_failed; }

    static inline std::vector<std::string> arguments{ "--gst-debug-level=1" };
    static inline guint major, minor, micro, nano;

private:
    bool is_failed{ false };

    initializer() {
        int argc{ 0 };
        std::vector<char*> args;
        args.push_back((char*)""); // first argument will be ignored
        for (auto const& arg : arguments)
            args.push_back((char*)arg.c_str());
        argc = static_cast<int>(args.size());
        char** argv{ args.data() };

        safe_ptr<GError> err;
        gboolean res{ gst_init_check(&argc, &argv, err.get_ref()) };
        if (!res) {
            LOG_WARNING_FMT( "gstreamer: can't initialize {}", (err ? err->message : "<unknown reason>") );
            is_failed = true;
            return;
        }

        gst_version(&major, &minor, &micro, &nano);
        LOG_INFO_FMT( "gstreamer: version {}.{}.{} {}", major, minor, micro, nano );
        if (GST_VERSION_MAJOR != major) {
            LOG_WARNING_FMT( "gstreamer: incompatible version" );
            is_failed = true;
        }
    }

protected:
    initializer(const initializer & r) = delete;
    initializer & operator = (const initializer & r) = delete;
};

// encoders usable in front of webrtcbin

struct encoder_info {
    std::string rtppay;         // payloader element
    std::string encoding;       // rtp encoding-name
    std::string bitrate_prop;   // encoder bitrate property
    int bitrate_scale;          // multiplier from kbit/sec to the property unit
    std::string params;         // low latency tuning
};

inline const std::map<std::string, encoder_info> map_encoder_info {
    { "x264enc",      { "rtph264pay", "H264", "bitrate",        1,    "tune=zerolatency speed-preset=ultrafast key-int-max=60 threads=4" } },
    { "openh264enc",  { "rtph264pay", "H264", "bitrate",        1000, "complexity=low rate-control=bitrate" } },
    { "nvh264enc",    { "rtph264pay", "H264", "bitrate",        1,    "zerolatency=true gop-size=60" } },
    { "vaapih264enc", { "rtph264pay", "H264", "bitrate",        1,    "keyframe-period=60" } },
    { "vp8enc",       { "rtpvp8pay",  "VP8",  "target-bitrate", 1000, "deadline=1 keyframe-max-dist=60" } },
    { "vp9enc",       { "rtpvp9pay",  "VP9",  "target-bitrate", 1000, "deadline=1 keyframe-max-dist=60" } }
};

// loop_t runs a GMainLoop on the calling thread and is the single place where
// work from other threads is marshalled: post() and post_delayed() are thread-safe.
// An exception escaping a task stops the loop and is rethrown from run().

struct loop_t {
    using task_t = std::function<void()>;

    // own_context: private GMainContext instead of the process default one
    explicit loop_t(bool own_context = false) {
        context.attach(own_context ? g_main_context_new() : g_main_context_ref(g_main_context_default()));
        loop.attach(g_main_loop_new(context, FALSE));
    }

    ~loop_t() {
        std::set<guint> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.swap(sources);
        }
        for (auto id : pending)
            destroy_source(id);
    }

    loop_t(const loop_t&) = delete;
    loop_t& operator=(const loop_t&) = delete;

    guint post(task_t task) {
        return attach(g_idle_source_new(), std::move(task));
    }

    guint post_delayed(std::chrono::milliseconds delay, task_t task) {
        return attach(g_timeout_source_new(static_cast<guint>(delay.count())), std::move(task));
    }

    // drops a pending task, no-op when it has already run
    void cancel(guint id) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!sources.erase(id))
                return;
        }
        destroy_source(id);
    }

    void run() {
        g_main_loop_run(loop);
        if (error) {
            auto e{ std::exchange(error, nullptr) };
            std::rethrow_exception(e);
        }
    }

    // queued behind already posted work, a quit before run() ends the next run()
    void quit() {
        if (quitting.exchange(true))
            return;
        post([this]() {
            quitting = false;
            g_main_loop_quit(loop);
        });
    }

    bool is_running() const { return g_main_loop_is_running(loop); }

    GMainContext* get_context() const { return context.get(); }

private:
    struct pending_t {
        loop_t* self;
        task_t task;
        guint id{ 0 };
    };

    guint attach(GSource* source, task_t task) {
        auto* pending = new pending_t{ this, std::move(task) };
        g_source_set_callback(source, &loop_t::dispatch, pending, &loop_t::release);
        std::lock_guard<std::mutex> lock(mutex);
        guint const id{ g_source_attach(source, context) };
        g_source_unref(source);
        pending->id = id;
        sources.insert(id);
        return id;
    }

    void destroy_source(guint id) {
        GSource* source{ g_main_context_find_source_by_id(context, id) };
        if (source)
            g_source_destroy(source);
    }

    static gboolean dispatch(gpointer data) {
        auto* pending = static_cast<pending_t*>(data);
        auto* self{ pending->self };
        try {
            pending->task();
        } catch (const std::exception& e) {
            LOG_ERROR_FMT( "loop task failed: {}", e.what() );
            if (!self->error)
                self->error = std::current_exception();
            g_main_loop_quit(self->loop);
        }
        return G_SOURCE_REMOVE;
    }

    static void release(gpointer data) {
        auto* pending = static_cast<pending_t*>(data);
        {
            std::lock_guard<std::mutex> lock(pending->self->mutex);
            pending->self->sources.erase(pending->id);
        }
        delete pending;
    }

    safe_ptr<GMainContext> context;
    safe_ptr<GMainLoop> loop;
    std::mutex mutex;
    std::set<guint> sources;
    std::atomic<bool> quitting{ false };
    std::exception_ptr error{ nullptr };
};

} // namespace gst

#endif // #ifndef __GST_HPP
