#include <uuid123/random_source.hpp>
#include <uuid123/uuid_gen.hpp>
#include "ut.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace uuid123;

// A source that always returns the same bytes.  For checking that
// the generators use the active source.
struct constant_source : public random_source{
    result_type generate() override {
        result_type ret;
        ret.fill(0x5a);
        return ret;
    }
    std::string name() const override { return "constant"; }
};

// Must run before anything constructs a secure_random_source.
void test_fill_without_object(){
    unsigned char a[32] = {}, b[32] = {};
    secure_random_source::fill(a, sizeof(a));
    secure_random_source::fill(b, sizeof(b));
    CHECK(std::equal(a, a+sizeof(a), b) == false);
    int nonzero = 0;
    for(auto c : a)
        nonzero += (c != 0);
    CHECK(nonzero > 16);
}

void test_fast(){
    fast_random_source a(12345), b(12345), c(54321);
    std::set<random_source::result_type> seen;
    for(int i=0; i<100; ++i){
        auto ra = a.generate();
        auto rb = b.generate();
        CHECK(ra == rb);
        CHECK(ra != c.generate());
        seen.insert(ra);
    }
    // successive results differ
    EQUAL(seen.size(), 100);
    EQSTR(a.name(), "fast");

    // Randomly keyed fast sources differ from each other.
    fast_random_source r1, r2;
    CHECK(r1.generate() != r2.generate());
}

void test_secure(){
    secure_random_source s;
    EQSTR(s.name(), "secure");
    auto x = s.generate();
    auto y = s.generate();
    CHECK(x != y);
    unsigned char buf[64] = {};
    secure_random_source::fill(buf, sizeof(buf));
    int nonzero = 0;
    for(auto b : buf)
        nonzero += (b != 0);
    CHECK(nonzero > 32);
}

void test_active(){
    auto orig = active_random_source();
    CHECK(orig != nullptr);
    CHECK(active_random_source() == orig);

    set_active_random_source(std::make_shared<constant_source>());
    EQSTR(active_random_source()->name(), "constant");
    // With a constant source, the no-argument generators are constant
    // too.
    EQUAL(random_uuid(), random_uuid());
    EQSTR(random_uuid().str(), "5a5a5a5a-5a5a-4a5a-9a5a-5a5a5a5a5a5a");

    THROWS(set_active_random_source(nullptr), std::invalid_argument);
    // ... and the failed set didn't change anything.
    EQSTR(active_random_source()->name(), "constant");

    set_active_random_source(std::make_shared<fast_random_source>(99));
    fast_random_source expected(99);
    EQUAL(random_uuid(), random_uuid(expected));

    set_active_random_source(orig);
    CHECK(active_random_source() == orig);

    EQSTR(make_random_source("secure")->name(), "secure");
    EQSTR(make_random_source("fast")->name(), "fast");
    THROWS(make_random_source("bogus"), std::invalid_argument);
    THROWS(make_random_source(""), std::invalid_argument);
}

// Many threads generating at once, some of them swapping the active
// source underneath the others.  No duplicates.
void test_concurrent(){
    const int NTHREADS = 8;
    const int PER_THREAD = 2000;
    std::mutex mtx;
    std::set<uuid> all;
    std::vector<std::thread> threads;
    for(int t=0; t<NTHREADS; ++t){
        threads.emplace_back([&, t](){
            std::vector<uuid> mine;
            for(int i=0; i<PER_THREAD; ++i){
                if(t == 0 && i%100 == 0)
                    set_active_random_source(make_random_source(i%200 ? "secure" : "fast"));
                mine.push_back(random_uuid());
            }
            std::lock_guard<std::mutex> lg(mtx);
            all.insert(mine.begin(), mine.end());
        });
    }
    for(auto& th : threads)
        th.join();
    EQUAL(all.size(), size_t(NTHREADS*PER_THREAD));

    // A single fast source shared by many threads doesn't hand out
    // the same counter twice.
    fast_random_source shared(2024);
    std::set<random_source::result_type> results;
    threads.clear();
    for(int t=0; t<NTHREADS; ++t){
        threads.emplace_back([&](){
            std::vector<random_source::result_type> mine;
            for(int i=0; i<PER_THREAD; ++i)
                mine.push_back(shared.generate());
            std::lock_guard<std::mutex> lg(mtx);
            results.insert(mine.begin(), mine.end());
        });
    }
    for(auto& th : threads)
        th.join();
    EQUAL(results.size(), size_t(NTHREADS*PER_THREAD));
}

int main(int, char **){
    test_fill_without_object();
    test_fast();
    test_secure();
    test_active();
    test_concurrent();
    return utstatus();
}
