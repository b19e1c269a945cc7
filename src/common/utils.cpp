#include "common/utils.hpp"
#include <fmt/core.h>
#include <stdlib.h>
#include <time.h>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string iso_timestamp() {
    return iso_timestamp(chrono::system_clock::now());
}

string iso_timestamp(chrono::system_clock::time_point tp) {
    time_t seconds = chrono::system_clock::to_time_t(tp);
    auto micros = chrono::duration_cast<chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;

    struct tm local;
    localtime_r(&seconds, &local);  // localtime 不是线程安全的
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
    return fmt::format("{}.{:06d}", buf, micros);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
