#pragma once

#include <dlfcn.h>
#include <string>
#include <stdexcept>

// Test-side access to the fake_mpdev_* hooks of a loaded fake vendor library.
class FakeMpDev {
    public:
        explicit FakeMpDev(const char* path) {
            handle = dlopen(path, RTLD_NOW | RTLD_LOCAL);
            if (handle == nullptr) throw std::runtime_error(dlerror());
            resolve(reset_fn, "fake_mpdev_reset");
            resolve(fail_next_fn, "fake_mpdev_fail_next");
            resolve(calls_fn, "fake_mpdev_calls");
            resolve(is_connected_fn, "fake_mpdev_is_connected");
            resolve(is_acquiring_fn, "fake_mpdev_is_acquiring");
            resolve(type_fn, "fake_mpdev_type");
            resolve(comm_fn, "fake_mpdev_comm");
            resolve(serial_fn, "fake_mpdev_serial");
            resolve(interval_ms_fn, "fake_mpdev_interval_ms");
            resolve(mask_fn, "fake_mpdev_mask");
            reset();
        }

        ~FakeMpDev() {
            dlclose(handle);
        }

        void reset() { reset_fn(); }
        void fail_next(const char* name, int code) { fail_next_fn(name, code); }
        int calls(const char* name) { return calls_fn(name); }
        bool is_connected() { return is_connected_fn() != 0; }
        bool is_acquiring() { return is_acquiring_fn() != 0; }
        int type() { return type_fn(); }
        int comm() { return comm_fn(); }
        std::string serial() { return serial_fn(); }
        double interval_ms() { return interval_ms_fn(); }
        int mask(int channel) { return mask_fn(channel); }
    private:
        void* handle;
        void (*reset_fn)();
        void (*fail_next_fn)(const char*, int);
        int (*calls_fn)(const char*);
        int (*is_connected_fn)();
        int (*is_acquiring_fn)();
        int (*type_fn)();
        int (*comm_fn)();
        const char* (*serial_fn)();
        double (*interval_ms_fn)();
        int (*mask_fn)(int);

        template <typename T>
        void resolve(T& target, const char* name) {
            void* symbol = dlsym(handle, name);
            if (symbol == nullptr) throw std::runtime_error(std::string("missing ") + name);
            target = reinterpret_cast<T>(symbol);
        }
};
