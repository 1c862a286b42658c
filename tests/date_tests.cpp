#include <cassert>
#include <cstdlib>
#include <ctime>
#include <string>

#include "net/IHttpClient.hpp"
#include "shell/Shell.hpp"
#include "vfs/MemoryVfs.hpp"

namespace {

class OfflineHttp : public IHttpClient {
public:
    HttpResponse send(const HttpRequest&) override { throw HttpError("offline"); }
};

struct Fixture {
    MemoryVfs storage;
    OfflineHttp http;
    Shell shell{storage, ShellConfig(), &http};

    std::string out(const std::string& script) {
        auto r = shell.execute(script);
        assert(r.exit_code == 0);
        return r.out;
    }
};

void test_fixed_dates_in_utc() {
    Fixture f;
    assert(f.out("date -u -d 2024-01-15 +%F") == "2024-01-15\n");
    assert(f.out("date -u -d @0") == "Thu Jan  1 00:00:00 UTC 1970\n");
    assert(f.out("date -u -d @1700000000 +%s") == "1700000000\n");
    assert(f.out("date -u -d 2024-03-05T14:07:09Z '+%Y %j %u %w %I %p %P'") == "2024 065 2 2 02 PM pm\n");
    assert(f.out("date -u -d 2024-03-05T14:07:09Z '+%T %R %D'") == "14:07:09 14:07 03/05/24\n");
    assert(f.out("date -u -d 2024-03-05T14:07:09Z '+%A %B %b %h %y'") == "Tuesday March Mar Mar 24\n");
    assert(f.out("date -u -d 2024-03-05T14:07:09Z +%c") == "Tue Mar  5 14:07:09 2024\n");
    assert(f.out("date -u -d 2024-03-05T14:07:09Z +%r") == "02:07:09 PM\n");
    assert(f.out("date -u -I -d 2024-03-05T14:07:09Z") == "2024-03-05T14:07:09+0000\n");
}

void test_offsets_and_literals() {
    Fixture f;
    assert(f.out("date -u -d 2024-01-15T10:00:00+02:00 +%H:%M") == "08:00\n");
    assert(f.out("date -u -d 2024-01-15T10:00-0130 +%H:%M") == "11:30\n");
    assert(f.out("date -u -d 2024-01-15 '+%%Y is %Y%n%t%Q'") == "%Y is 2024\n\t%Q\n");
}

void test_local_time_follows_tz() {
    setenv("TZ", "UTC", 1);
    tzset();
    Fixture f;
    assert(f.out("date -d '2024-01-15 08:30' '+%H:%M %z'") == "08:30 +0000\n");
}

void test_current_time_is_recent() {
    Fixture f;
    auto s = f.out("date +%s");
    long long now = static_cast<long long>(std::time(nullptr));
    long long printed = std::stoll(s);
    assert(printed <= now && now - printed < 60);
}

void test_free_form_dates() {
    setenv("TZ", "UTC", 1);
    tzset();
    Fixture f;
    assert(f.out("date -u -d 2024-01-15T10:30:00.000Z '+%F %T'") == "2024-01-15 10:30:00\n");
    assert(f.out("date -u -d 2024-01-15T10:30:00.5+05:30 +%T") == "05:00:00\n");
    assert(f.out("date -u -d 2024-02-29 +%F") == "2024-02-29\n");
    assert(f.out("date -u -d 2024/01/15 +%F") == "2024-01-15\n");
    assert(f.out("date -u -d 01/15/24 +%F") == "2024-01-15\n");
    assert(f.out("date -u -d 'Jan 15 2024' +%F") == "2024-01-15\n");
    assert(f.out("date -u -d 'January 15, 2024' +%F") == "2024-01-15\n");
    assert(f.out("date -u -d 15-Jan-2024 +%F") == "2024-01-15\n");
    assert(f.out("date -u -d 'January 15, 2024 3:04 PM' '+%F %R'") == "2024-01-15 15:04\n");
    assert(f.out("date -u -d 'Mon, 15 Jan 2024 10:30:00 GMT' +%T") == "10:30:00\n");
    assert(f.out("date -u -d 'Mon Jan 15 2024 10:30:00 GMT+0200 (Central European Standard Time)' +%T") == "08:30:00\n");
    assert(f.out("date -u -d 'Jan 15 2024 10:00 EST' +%H") == "15\n");
    assert(f.out("date -u -d @1.9 +%s") == "1\n");
    assert(f.out("date -u -d @-86400 +%F") == "1969-12-31\n");
}

void test_errors() {
    Fixture f;
    auto bad = f.shell.execute("date -d nonsense");
    assert(bad.exit_code == 1);
    assert(bad.err == "date: invalid date 'nonsense'\n");

    auto opt = f.shell.execute("date -x");
    assert(opt.exit_code == 1);
    assert(opt.err == "date: invalid option -- '-x'\n");

    auto missing = f.shell.execute("date -d");
    assert(missing.exit_code == 1);
    assert(missing.err == "date: option requires an argument -- d\n");

    assert(f.shell.execute("date -u -d 2024-13-01").exit_code == 1);

    for (const char* text : {"@99999999999999999999999", "@8640000000001", "2023-02-29", "'Feb 30 2024'",
                             "'Jan 15'", "'13:00 PM Jan 1 2024'", "'Jan 15 2024 (open'", "@"}) {
        auto r = f.shell.execute(std::string("date -u -d ") + text);
        assert(r.exit_code == 1);
        assert(r.err.compare(0, 20, "date: invalid date '") == 0);
    }
}

} // namespace

int main() {
    test_fixed_dates_in_utc();
    test_offsets_and_literals();
    test_local_time_follows_tz();
    test_current_time_is_recent();
    test_free_form_dates();
    test_errors();

    return 0;
}
