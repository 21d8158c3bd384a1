/**
 * @file sfml_music_source.hpp
 * @brief Looping music playback that doubles as the energy model's sample feed
 */

#pragma once

#include <string>
#include <vector>

#include <SFML/Audio.hpp>

#include "beatfield/audio/amplitude_source.hpp"

/**
 * @class SfmlMusicSource
 * @brief Plays a music file through sf::Sound and serves the samples just
 *        behind the playing offset.
 *
 * The whole file is decoded into an sf::SoundBuffer so that samples around
 * the playback position can be read back directly.
 */
class SfmlMusicSource : public Audio::IAmplitudeSource {
public:
    SfmlMusicSource() = default;
    ~SfmlMusicSource() override;

    /**
     * @brief Loads and starts the first candidate that decodes
     * @return false if none of the files could be loaded
     */
    bool load(const std::vector<std::string>& candidates);

    bool isAvailable() const override;
    std::vector<float> recentSamples(std::size_t count) const override;

    const std::string& getLoadedFile() const { return loadedFile; }

    /// music.ogg, music.wav, music.flac; SFML 2 cannot decode MP3
    static std::vector<std::string> defaultCandidates();

private:
    sf::SoundBuffer buffer;
    sf::Sound sound;       // must be destroyed before buffer
    std::string loadedFile;
    bool loaded = false;
};
