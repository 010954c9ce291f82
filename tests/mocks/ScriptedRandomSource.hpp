/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCRIPTED_RANDOM_SOURCE_HPP
#define SCRIPTED_RANDOM_SOURCE_HPP

#include "core/Dice.hpp"
#include <algorithm>
#include <deque>
#include <initializer_list>

// A random source that replays queued faces, for exact dice in rules tests.
// Each face is clamped into the requested range; an empty queue returns lo.
class ScriptedRandomSource : public SoloAdventure::RandomSource {
public:
    ScriptedRandomSource() = default;

    void push(std::initializer_list<int> faces) {
        m_faces.insert(m_faces.end(), faces.begin(), faces.end());
    }

    int uniformInt(int lo, int hi) override {
        ++m_calls;
        if (m_faces.empty()) {
            return lo;
        }
        int face = m_faces.front();
        m_faces.pop_front();
        return std::clamp(face, lo, hi);
    }

    // Test helper methods
    size_t remaining() const { return m_faces.size(); }
    int calls() const { return m_calls; }
    void reset() {
        m_faces.clear();
        m_calls = 0;
    }

private:
    std::deque<int> m_faces;
    int m_calls{0};
};

#endif // SCRIPTED_RANDOM_SOURCE_HPP
