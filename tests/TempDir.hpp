#pragma once
#include <glib.h>
#include <glib/gstdio.h>
#include <stdexcept>
#include <string>

namespace TableScrape {
namespace Testing {

// Scratch directory removed with its files when the test ends.
class TempDir {
public:
    TempDir() {
        GError* error = nullptr;
        gchar* dir = g_dir_make_tmp("tablescrape_XXXXXX", &error);
        if (!dir) {
            std::string reason = error ? error->message : "unknown error";
            if (error) g_error_free(error);
            throw std::runtime_error("cannot create temp dir: " + reason);
        }
        path_ = dir;
        g_free(dir);
    }

    ~TempDir() {
        GDir* dir = g_dir_open(path_.c_str(), 0, nullptr);
        if (dir) {
            while (const gchar* name = g_dir_read_name(dir)) {
                g_remove(file(name).c_str());
            }
            g_dir_close(dir);
        }
        g_rmdir(path_.c_str());
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return path_ + "/" + name; }

    std::string write(const std::string& name, const std::string& contents) const {
        std::string target = file(name);
        if (!g_file_set_contents(target.c_str(), contents.data(), static_cast<gssize>(contents.size()), nullptr)) {
            throw std::runtime_error("cannot write " + target);
        }
        return target;
    }

    static std::string read(const std::string& path) {
        gchar* contents = nullptr;
        gsize length = 0;
        if (!g_file_get_contents(path.c_str(), &contents, &length, nullptr)) return {};
        std::string out(contents, length);
        g_free(contents);
        return out;
    }

    static bool exists(const std::string& path) {
        return g_file_test(path.c_str(), G_FILE_TEST_EXISTS);
    }

private:
    std::string path_;
};

}
}
