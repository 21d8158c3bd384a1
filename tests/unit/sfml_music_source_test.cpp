#include <gtest/gtest.h>
#include <string>
#include "beatfield/app/sfml_music_source.hpp"

namespace {

bool hasExtension(const std::string& file, const std::string& ext) {
    return file.size() >= ext.size() &&
           file.compare(file.size() - ext.size(), ext.size(), ext) == 0;
}

} // namespace

TEST(SfmlMusicSourceTest, DefaultCandidatesAreDecodableFormats) {
    auto const candidates = SfmlMusicSource::defaultCandidates();
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates.front(), "music.ogg");

    for (const auto& file : candidates) {
        bool const supported = hasExtension(file, ".ogg") ||
                               hasExtension(file, ".wav") ||
                               hasExtension(file, ".flac");
        EXPECT_TRUE(supported) << file;
        EXPECT_FALSE(hasExtension(file, ".mp3")) << file;
    }
}
