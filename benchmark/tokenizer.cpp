#include <benchmark/benchmark.h>

#include "DocumentTokenizer.hpp"
#include "ProperNameTokenizer.hpp"
#include "dictionary_loader.hpp"
#include "common.hpp"

static void SegmenterCreation(benchmark::State& state) {
    IcuSegmenterFactory factory("en_US");
    for (auto _ : state) {
        benchmark::DoNotOptimize(factory.make_word_segmenter());
    }
}
BENCHMARK(SegmenterCreation);

static void BaseTokenizer(benchmark::State& state) {
    DocumentTokenizer tokenizer;
    std::size_t i = 0;
    for (auto _ : state) {
        auto document = tokenizer.parse_document(sample_documents[i++ & (sample_documents.size() - 1)]);
        benchmark::DoNotOptimize(document);
    }
}
BENCHMARK(BaseTokenizer);

static void ProperNames(benchmark::State& state) {
    ProperNameTokenizer tokenizer(load_dictionary(std::filesystem::path(PNTOK_DEFAULT_DICTIONARY)));
    std::size_t i = 0;
    for (auto _ : state) {
        auto document = tokenizer.parse_document(sample_documents[i++ & (sample_documents.size() - 1)]);
        benchmark::DoNotOptimize(all_proper_names(document));
    }
}
BENCHMARK(ProperNames);

BENCHMARK_MAIN();
