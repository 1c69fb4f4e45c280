#include "name_generator.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <stdexcept>
#include <iterator>

static const char* const ADJECTIVES[] = {
    "admiring", "agitated", "amazing", "angry", "astonishing", "awesome",
    "berserk", "big", "boring", "clever", "compassionate", "condescending",
    "confident", "cranky", "curious", "dreamy", "ecstatic", "elated",
    "elegant", "evil", "extravagant", "fabulous", "fervent", "festering",
    "focused", "friendly", "furious", "gigantic", "goofy", "happy",
    "hopeful", "hungry", "infallible", "insane", "intergalactic", "jolly",
    "jovial", "kickass", "lonely", "loving", "mad", "modest", "naughty",
    "nauseous", "nice", "nostalgic", "peaceful", "pedantic", "pensive",
    "prickly", "reverent", "romantic", "sad", "serene", "sharp", "sick",
    "silly", "sleepy", "small", "special", "stoic", "stupefied",
    "suspicious", "tender", "thirsty", "tiny", "trusting", "voluminous",
    "wise", "zen", "quirky",
};

static const char* const SCIENTISTS[] = {
    "agnesi", "albattani", "allen", "almeida", "archimedes", "ardinghelli",
    "aryabhata", "austin", "babbage", "banach", "bardeen", "bartik",
    "bassi", "bell", "bhabha", "bhaskara", "blackwell", "bohr", "boyd",
    "brahmagupta", "brattain", "brown", "carson", "chandrasekhar", "cori",
    "crick", "curie", "darwin", "davinci", "dijkstra", "einstein", "elion",
    "engelbart", "euclid", "euler", "fermat", "fermi", "feynman",
    "franklin", "galileo", "gates", "goldberg", "goodall", "hamilton",
    "hawking", "heisenberg", "hodgkin", "hoover", "hopper", "hypatia",
    "jang", "jennings", "jepsen", "joliot", "jones", "kalam", "keller",
    "khorana", "kilby", "kirch", "knuth", "kowalevski", "lalande", "lamarr",
    "leakey", "leavitt", "lovelace", "lumiere", "mayer", "mccarthy",
    "mcclintock", "mclean", "meitner", "mendel", "mestorf", "minsky",
    "mirzakhani", "morse", "murdock", "newton", "nightingale", "nobel",
    "noether", "northcutt", "noyce", "panini", "pare", "pasteur", "payne",
    "perlman", "pike", "poincare", "poitras", "ptolemy", "raman",
    "ramanujan", "ride", "ritchie", "roentgen", "rosalind", "saha",
    "sammet", "shaw", "shockley", "sinoussi", "snyder", "spence",
    "stallman", "stonebraker", "swanson", "swartz", "swirles", "tesla",
    "thompson", "torvalds", "turing", "varahamihira", "visvesvaraya",
    "wescoff", "williams", "wilson", "wing", "wozniak", "wright", "yalow",
    "yonath",
};

NameGenerator::NameGenerator() : rng_(std::random_device{}()) {}

NameGenerator::NameGenerator(unsigned seed) : rng_(seed) {}

std::string NameGenerator::next() {
    std::uniform_int_distribution<size_t> adj(0, std::size(ADJECTIVES) - 1);
    std::uniform_int_distribution<size_t> sci(0, std::size(SCIENTISTS) - 1);
    return fmt::format("{}-{}", ADJECTIVES[adj(rng_)], SCIENTISTS[sci(rng_)]);
}

std::string NameGenerator::next_unused(const std::function<bool(const std::string&)>& taken) {
    for (int i = 0; i < NAME_GENERATOR_MAX_TRIES; i++) {
        std::string name = next();
        if (!taken(name)) return name;
    }
    throw std::runtime_error("Unable to generate a unique run name -- Specify one with -name");
}
