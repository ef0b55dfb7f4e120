#include "TurnSounds.h"

#include <algorithm>
#include <iostream>

TurnSounds::~TurnSounds() {
    stopAll();
}

size_t TurnSounds::load(const std::vector<std::string>& paths, float volumeValue) {
    stopAll();
    clips.clear();
    volume = std::clamp(volumeValue, 0.0f, 100.0f);

    for (const auto& path : paths) {
        if (path.empty()) {
            continue;
        }
        // Clip holds the buffer the sound points at, so it must not move after setBuffer
        auto clip = std::make_unique<Clip>();
        if (!clip->buffer.loadFromFile(path)) {
            std::cerr << "[TurnSounds] Failed to load turn sound: " << path << std::endl;
            continue;
        }
        clip->sound.setBuffer(clip->buffer);
        clip->sound.setVolume(volume);
        clips.push_back(std::move(clip));
        std::cout << "[TurnSounds] Loaded " << path << std::endl;
    }
    return clips.size();
}

void TurnSounds::play(float moveDuration) {
    if (clips.empty()) {
        return;
    }

    std::uniform_int_distribution<size_t> pick(0, clips.size() - 1);
    Clip& clip = *clips[pick(rng)];

    float durationSeconds = std::max(moveDuration, 0.01f);
    float sourceDuration = std::max(clip.buffer.getDuration().asSeconds(), 0.01f);
    float pitch = std::clamp(sourceDuration / durationSeconds * pitchJitter(rng), 0.25f, 4.0f);

    clip.sound.stop();
    clip.sound.setPitch(pitch);
    clip.sound.play();
}

void TurnSounds::stopAll() {
    for (auto& clip : clips) {
        if (clip->sound.getStatus() != sf::Sound::Stopped) {
            clip->sound.stop();
        }
    }
}
