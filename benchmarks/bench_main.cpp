#include "paramdec/paramdec.hpp"
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct Leaf { int Value = 0; std::vector<int> Items; };
struct Tree {
    std::unique_ptr<Tree> Left;
    std::unique_ptr<Tree> Right;
    std::map<std::string, Leaf> Leaves;
    std::string Label;
};

namespace paramdec {
template <> struct record<Leaf> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Leaf";
    static void fields(Fields<Leaf>& f){ PARAMDEC_FIELD(f, Leaf, Value); PARAMDEC_FIELD(f, Leaf, Items); }
};
template <> struct record<Tree> {
    static constexpr bool enabled = true;
    static constexpr const char* name = "Tree";
    static void fields(Fields<Tree>& f){
        PARAMDEC_FIELD(f, Tree, Left); PARAMDEC_FIELD(f, Tree, Right);
        PARAMDEC_FIELD(f, Tree, Leaves); PARAMDEC_FIELD(f, Tree, Label);
    }
};
} // namespace paramdec

struct RunResult { double ms_cold; double ms_warm; size_t keys; };

static RunResult bench_case(const paramdec::Values& values, int iterations){
    paramdec::RecordCache cache;
    paramdec::Decoder dec(cache, paramdec::DecodeEnv{});

    auto t0 = Clock::now();
    { Tree t; dec.decode_into(values, t); }
    auto t1 = Clock::now();
    for(int i=0;i<iterations;++i){ Tree t; dec.decode_into(values, t); }
    auto t2 = Clock::now();
    double ms_cold = std::chrono::duration<double, std::milli>(t1 - t0).count();
    double ms_warm = std::chrono::duration<double, std::milli>(t2 - t1).count() / iterations;
    return { ms_cold, ms_warm, values.size() };
}

int main(){
    struct Case { const char* name; paramdec::Values values; };
    std::vector<Case> cases;

    // Case 1: flat leaves
    cases.push_back({"flat", {{"Label", {"root"}}, {"Leaves[a][Value]", {"1"}}, {"Leaves[b][Value]", {"2"}}}});

    // Case 2: deep pointer chains
    paramdec::Values deep;
    std::string path;
    for(int d=0; d<16; ++d){
        path += (d % 2) ? "[Right]" : "[Left]";
        deep["Left" + path + "[Label]"] = {"n" + std::to_string(d)};
    }
    cases.push_back({"deep", std::move(deep)});

    // Case 3: wide map of sequences
    paramdec::Values wide;
    for(int i=0;i<200;++i) wide["Leaves[k" + std::to_string(i) + "][Items][]"] = {"1", "2", "3", "4"};
    cases.push_back({"wide", std::move(wide)});

    std::cout << "name,keys,ms_cold,ms_warm\n";
    for(const auto &c : cases){
        try {
            auto r = bench_case(c.values, 200);
            std::cout << c.name << "," << r.keys << "," << r.ms_cold << "," << r.ms_warm << "\n";
        } catch(const paramdec::decode_error& e) {
            std::cerr << "[bench] case '" << c.name << "' failed: " << e.what() << "\n";
        }
    }
    return 0;
}
