#include "BaseTestFixture.h"
#include "ImageFinder.hpp"

#include <map>
#include <set>

namespace {

HashLookup lookupFrom(const std::map<std::string, std::optional<PerceptualHash>>& table) {
    return [table](const std::string& path) -> std::optional<PerceptualHash> {
        auto it = table.find(path);
        if (it == table.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

// --- Hamming distance ---

TEST(HammingDistanceTest, ZeroForIdenticalHashes) {
    ASSERT_EQ(DuplicateFinder::hammingDistance(0xDEADBEEFULL, 0xDEADBEEFULL), 0);
    ASSERT_EQ(DuplicateFinder::hammingDistance(0, 0), 0);
}

TEST(HammingDistanceTest, Symmetric) {
    PerceptualHash a = 0x0F0F00FF12345678ULL;
    PerceptualHash b = 0xF0F0FF0087654321ULL;
    ASSERT_EQ(DuplicateFinder::hammingDistance(a, b), DuplicateFinder::hammingDistance(b, a));
}

TEST(HammingDistanceTest, CountsDifferingBits) {
    ASSERT_EQ(DuplicateFinder::hammingDistance(0, ~0ULL), 64);
    ASSERT_EQ(DuplicateFinder::hammingDistance(0b1011, 0), 3);
    ASSERT_EQ(DuplicateFinder::hammingDistance(0b1011, 0b0110), 3);
}

// --- Grouping ---

TEST(DuplicateGroupingTest, IdenticalPairGroupedDistantImageLeftOut) {
    auto lookup = lookupFrom({
        {"A", 0x00FF00FF00FF00FFULL},
        {"B", 0x00FF00FF00FF00FFULL},
        {"C", 0x00FF00FF00FF00FFULL ^ ((1ULL << 20) - 1)},   // 20 bits away
    });

    auto groups = DuplicateFinder::findDuplicateGroups({"A", "B", "C"}, lookup, 5);

    ASSERT_EQ(groups.size(), 1);
    ASSERT_EQ(groups[0], (DuplicateGroup{"A", "B"}));
}

TEST(DuplicateGroupingTest, MembersAreComparedWithCanonicalOnly) {
    // d(A,B) = 3, d(B,C) = 3, d(A,C) = 6: C is close to B but not to A
    auto lookup = lookupFrom({
        {"A", 0x000ULL},
        {"B", 0x007ULL},
        {"C", 0x1C7ULL},
    });
    ASSERT_EQ(DuplicateFinder::hammingDistance(0x007ULL, 0x1C7ULL), 3);
    ASSERT_EQ(DuplicateFinder::hammingDistance(0x000ULL, 0x1C7ULL), 6);

    auto groups = DuplicateFinder::findDuplicateGroups({"A", "B", "C"}, lookup, 5);

    ASSERT_EQ(groups.size(), 1);
    ASSERT_EQ(groups[0], (DuplicateGroup{"A", "B"}));
}

TEST(DuplicateGroupingTest, InputOrderPicksCanonical) {
    auto lookup = lookupFrom({{"A", 0x1ULL}, {"B", 0x1ULL}});

    auto groups = DuplicateFinder::findDuplicateGroups({"B", "A"}, lookup, 0);

    ASSERT_EQ(groups.size(), 1);
    ASSERT_EQ(groups[0].front(), "B");
}

TEST(DuplicateGroupingTest, ThresholdZeroRequiresExactMatch) {
    auto lookup = lookupFrom({{"A", 0x10ULL}, {"B", 0x11ULL}, {"C", 0x10ULL}});

    auto groups = DuplicateFinder::findDuplicateGroups({"A", "B", "C"}, lookup, 0);

    ASSERT_EQ(groups.size(), 1);
    ASSERT_EQ(groups[0], (DuplicateGroup{"A", "C"}));
}

TEST(DuplicateGroupingTest, UnhashableImagesNeverGrouped) {
    auto lookup = lookupFrom({
        {"A", 0x0ULL},
        {"broken", std::nullopt},
        {"B", 0x0ULL},
    });

    auto groups = DuplicateFinder::findDuplicateGroups({"A", "broken", "B", "missing"}, lookup, 64);

    ASSERT_EQ(groups.size(), 1);
    ASSERT_EQ(groups[0], (DuplicateGroup{"A", "B"}));
}

TEST(DuplicateGroupingTest, SingletonsAreNotEmitted) {
    auto lookup = lookupFrom({{"A", 0x0ULL}, {"B", ~0ULL}, {"C", 0xFFFFFFFFULL}});

    auto groups = DuplicateFinder::findDuplicateGroups({"A", "B", "C"}, lookup, 5);

    ASSERT_TRUE(groups.empty());
}

TEST(DuplicateGroupingTest, GroupsAreDisjointAndDeterministic) {
    std::map<std::string, std::optional<PerceptualHash>> table;
    std::vector<std::string> images;
    for (int i = 0; i < 24; ++i) {
        std::string name = "img" + std::to_string(i);
        // Four clusters, members differing from the cluster seed by one bit
        PerceptualHash seed = 0xFFULL << ((i % 4) * 16);
        table[name] = seed ^ (1ULL << (i % 7 + 40));
        images.push_back(name);
    }
    auto lookup = lookupFrom(table);

    auto first = DuplicateFinder::findDuplicateGroups(images, lookup, 2);
    auto second = DuplicateFinder::findDuplicateGroups(images, lookup, 2);
    ASSERT_EQ(first, second);
    ASSERT_FALSE(first.empty());

    std::set<std::string> seen;
    std::set<std::string> canonicals;
    for (const auto& group : first) {
        ASSERT_GE(group.size(), 2);
        canonicals.insert(group.front());
        for (const auto& member : group) {
            ASSERT_TRUE(seen.insert(member).second) << member << " appears in two groups";
        }
    }
    // A canonical is never a non-first member of another group
    for (const auto& group : first) {
        for (size_t k = 1; k < group.size(); ++k) {
            ASSERT_EQ(canonicals.count(group[k]), 0);
        }
    }
}

TEST(DuplicateGroupingTest, GroupsOrderedByCanonicalPosition) {
    auto lookup = lookupFrom({
        {"A", 0x0ULL}, {"B", ~0ULL}, {"C", 0x0ULL}, {"D", ~0ULL},
    });

    auto groups = DuplicateFinder::findDuplicateGroups({"A", "B", "C", "D"}, lookup, 1);

    ASSERT_EQ(groups.size(), 2);
    ASSERT_EQ(groups[0], (DuplicateGroup{"A", "C"}));
    ASSERT_EQ(groups[1], (DuplicateGroup{"B", "D"}));
}

// --- HashCache ---

TEST(HashCacheTest, ComputesEachPathOnce) {
    int calls = 0;
    HashCache cache([&calls](const std::string& path) -> std::optional<PerceptualHash> {
        calls++;
        if (path == "broken") return std::nullopt;
        return static_cast<PerceptualHash>(path.size());
    });

    ASSERT_EQ(cache.get("abc"), PerceptualHash(3));
    ASSERT_EQ(cache.get("abc"), PerceptualHash(3));
    ASSERT_FALSE(cache.get("broken").has_value());
    ASSERT_FALSE(cache.get("broken").has_value());

    ASSERT_EQ(calls, 2);
    ASSERT_EQ(cache.size(), 2);
}

// --- Average hash on real pixels ---

class AverageHashTest : public BaseTestFixture {};

TEST_F(AverageHashTest, IdenticalImagesHashEqual) {
    auto h1 = DuplicateFinder::hashImageFile(sharp_png.string());
    auto h2 = DuplicateFinder::hashImageFile(sharpCopy_png.string());
    ASSERT_TRUE(h1.has_value());
    ASSERT_TRUE(h2.has_value());
    ASSERT_EQ(DuplicateFinder::hammingDistance(*h1, *h2), 0);
}

TEST_F(AverageHashTest, DifferentImagesFarApart) {
    auto uniform = DuplicateFinder::computeAverageHash(solidImage(800, 600, 128));
    auto circle = DuplicateFinder::computeAverageHash(circleImage());
    ASSERT_GT(DuplicateFinder::hammingDistance(uniform, circle), 5);
}

TEST_F(AverageHashTest, UndecodableFileHasNoHash) {
    ASSERT_FALSE(DuplicateFinder::hashImageFile(corrupt_jpg.string()).has_value());
    ASSERT_FALSE(DuplicateFinder::hashImageFile((tempDir / "nope.png").string()).has_value());
}

TEST_F(AverageHashTest, UndecodableFileIsReported) {
    ::testing::internal::CaptureStderr();
    auto hash = DuplicateFinder::hashImageFile(corrupt_jpg.string());
    std::string log = ::testing::internal::GetCapturedStderr();

    ASSERT_FALSE(hash.has_value());
    ASSERT_NE(log.find("Warning: failed to hash image " + corrupt_jpg.string()), std::string::npos);
}

TEST_F(AverageHashTest, GroupsFilesOnDisk) {
    std::vector<std::string> images = {
        sharp_png.string(), sharpCopy_png.string(), circle_bmp.string(), corrupt_jpg.string()
    };

    auto groups = DuplicateFinder::findDuplicateGroups(images, &DuplicateFinder::hashImageFile, 5);

    ASSERT_EQ(groups.size(), 1);
    ASSERT_EQ(groups[0], (DuplicateGroup{sharp_png.string(), sharpCopy_png.string()}));
}
