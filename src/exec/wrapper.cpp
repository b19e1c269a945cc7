#include "exec/wrapper.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <time.h>
#include <atomic>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace pyexec {
using namespace std;
namespace fs = std::filesystem;

static const char *HARNESS_HEADER = R"PY(#!/usr/bin/env python3
# -*- coding: utf-8 -*-

)PY";

// harness 所需的模块在用户代码之后以别名导入，避免用户代码覆盖 json、sys 等名字
static const char *HARNESS_FOOTER = R"PY(

if __name__ == "__main__":
    import contextlib as _harness_contextlib
    import io as _harness_io
    import json as _harness_json
    import sys as _harness_sys
    import traceback as _harness_traceback

    # 服务端只能精确表示 64 位整数
    def _harness_check_integers(value):
        if isinstance(value, bool):
            return
        if isinstance(value, int):
            if not -(1 << 63) <= value < (1 << 64):
                raise ValueError("main() returned an integer outside the 64-bit range: %d" % value)
        elif isinstance(value, dict):
            for item in value.values():
                _harness_check_integers(item)
        elif isinstance(value, (list, tuple)):
            for item in value:
                _harness_check_integers(item)

    try:
        _harness_stdout = _harness_io.StringIO()
        with _harness_contextlib.redirect_stdout(_harness_stdout):
            _harness_result = main()

        if _harness_result is None:
            raise ValueError("main() function must return a value")

        # 返回值不能被序列化时 dumps 抛出 TypeError 或 ValueError（NaN、Infinity），同样按错误上报
        _harness_payload = _harness_json.dumps({
            "result": _harness_result,
            "stdout": _harness_stdout.getvalue(),
        }, allow_nan=False)
        _harness_check_integers(_harness_result)
        print(_harness_payload, file=_harness_sys.stderr, flush=True)
    except BaseException as _harness_error:
        print(_harness_json.dumps({
            "error": str(_harness_error),
            "type": type(_harness_error).__name__,
            "trace": _harness_traceback.format_exc(),
        }), file=_harness_sys.stderr, flush=True)
        _harness_sys.exit(1)
)PY";

string synthesize_wrapper(const string &source) {
    string wrapper = HARNESS_HEADER;
    wrapper += source;
    if (source.empty() || source.back() != '\n')
        wrapper += '\n';
    wrapper += HARNESS_FOOTER;
    return wrapper;
}

string make_artifact_name(chrono::system_clock::time_point tp, unsigned long counter) {
    time_t seconds = chrono::system_clock::to_time_t(tp);
    auto micros = chrono::duration_cast<chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
    struct tm local;
    localtime_r(&seconds, &local);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
    return fmt::format("script_{}_{:06d}_{}.py", buf, micros, counter);
}

// 同一微秒内的并发请求依靠计数器区分
static atomic<unsigned long> artifact_counter{0};

wrapper_artifact::wrapper_artifact(const fs::path &dir, const string &content) {
    while (true) {
        file = dir / make_artifact_name(chrono::system_clock::now(), artifact_counter++);
        bool created;
        try {
            created = create_file_exclusive(file, content, 0755);
        } catch (system_error &e) {
            throw internal_error(fmt::format("Unable to create artifact {}: {}", file.string(), e.what()));
        }
        if (created) break;
        LOG(WARNING) << "Artifact " << file << " already exists, retrying";
    }
}

wrapper_artifact::~wrapper_artifact() {
    remove();
}

const fs::path &wrapper_artifact::path() const {
    return file;
}

void wrapper_artifact::remove() {
    if (removed) return;
    removed = true;
    error_code ec;
    if (!fs::remove(file, ec) && ec)
        LOG(ERROR) << "Unable to remove artifact " << file << ": " << ec.message();
}

}  // namespace pyexec
