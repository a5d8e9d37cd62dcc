#ifndef COMMON_HPP
#define COMMON_HPP

#include <array>
#include <string_view>

using namespace std::literals;

constexpr std::array sample_documents = {
    "Gavrilo Princip shot Franz Ferdinand in Sarajevo on 28 June 1914."sv,
    "The assassination led to war between Austria-Hungary and the Kingdom of Serbia! Did anyone expect it?"sv,
    "Nedeljko Čabrinović threw a bomb at the motorcade, which missed. Oskar Potiorek survived."sv,
    "hello world, this sentence has no proper names in it at all."sv,
    "Otto von Bismarck had predicted that some damned foolish thing in the Balkans would start the war."sv,
    "Gavrilo Principe is not a name. Franz Joseph I was emperor. Wilhelm II was kaiser."sv,
    "Young Bosnia and the Black Hand were both involved, according to Dragutin Dimitrijević."sv,
    "Serbia, Bosnia and Herzegovina, and the United Kingdom all appear in this one."sv
};

static_assert((sample_documents.size() & (sample_documents.size() - 1)) == 0);

#endif
