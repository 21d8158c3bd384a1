#include "beatfield/app/sfml_music_source.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

SfmlMusicSource::~SfmlMusicSource() {
    if (loaded) {
        sound.stop();
    }
}

std::vector<std::string> SfmlMusicSource::defaultCandidates() {
    return {"music.ogg", "music.wav", "music.flac"};
}

bool SfmlMusicSource::load(const std::vector<std::string>& candidates) {
    for (const auto& file : candidates) {
        if (!std::ifstream(file).good()) {
            continue;
        }
        if (!buffer.loadFromFile(file)) {
            std::cerr << "[Audio] Could not decode " << file << std::endl;
            continue;
        }
        if (buffer.getChannelCount() == 0 || buffer.getSampleCount() == 0) {
            std::cerr << "[Audio] " << file << " contains no samples" << std::endl;
            continue;
        }

        sound.setBuffer(buffer);
        sound.setLoop(true);
        sound.play();
        loadedFile = file;
        loaded = true;
        std::cout << "[Audio] Loaded music file: " << file << std::endl;
        return true;
    }

    std::cout << "[Audio] No music file found. Using simulated audio." << std::endl;
    return false;
}

bool SfmlMusicSource::isAvailable() const {
    return loaded && sound.getStatus() == sf::Sound::Playing;
}

std::vector<float> SfmlMusicSource::recentSamples(std::size_t count) const {
    std::vector<float> out;
    if (!loaded) {
        return out;
    }

    unsigned int const channels = buffer.getChannelCount();
    std::size_t const totalFrames = buffer.getSampleCount() / channels;
    const sf::Int16* samples = buffer.getSamples();

    auto const playingFrame = static_cast<std::size_t>(
        sound.getPlayingOffset().asSeconds() * static_cast<float>(buffer.getSampleRate()));
    std::size_t const end = std::min(playingFrame, totalFrames);
    std::size_t const begin = end > count ? end - count : 0;

    float const gain = sound.getVolume() / 100.0F;
    out.reserve(end - begin);
    for (std::size_t frame = begin; frame < end; ++frame) {
        // Mix down to mono
        float sum = 0.0F;
        for (unsigned int c = 0; c < channels; ++c) {
            sum += static_cast<float>(samples[frame * channels + c]);
        }
        out.push_back(sum / static_cast<float>(channels) / 32768.0F * gain);
    }
    return out;
}
