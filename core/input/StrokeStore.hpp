#pragma once
#include <cstddef>
#include <fstream>
#include <functional>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace kc {

// Point in capture-surface coordinates.
struct Point {
    float x;
    float y;
};

using Stroke = std::vector<Point>;

// Immutable view of one input session handed to rendering and recognition.
struct Session {
    std::vector<Stroke> strokes;
    Stroke active;

    bool empty() const { return strokes.empty() && active.empty(); }

    size_t pointCount() const {
        size_t n = active.size();
        for (const auto &s : strokes)
            n += s.size();
        return n;
    }
};

// StrokeStore owns the strokes of a session and is fed by pointer events in
// begin -> extend* -> end order. Observers are told after every change.
class StrokeStore {
public:
    using Observer = std::function<void(const StrokeStore &)>;

    void beginStroke(Point p) {
        m_active.clear();
        m_active.push_back(p);
        m_hasActive = true;
        notify();
    }

    void extendStroke(Point p) {
        if (!m_hasActive)
            return;
        m_active.push_back(p);
        notify();
    }

    void endStroke() {
        if (!m_hasActive)
            return;
        m_hasActive = false;
        if (!m_active.empty())
            m_strokes.push_back(std::move(m_active));
        m_active.clear();
        notify();
    }

    void clear() {
        m_strokes.clear();
        m_active.clear();
        m_hasActive = false;
        notify();
    }

    bool isEmpty() const { return m_strokes.empty() && m_active.empty(); }
    bool hasActiveStroke() const { return m_hasActive; }

    const std::vector<Stroke> &strokes() const { return m_strokes; }
    const Stroke &activeStroke() const { return m_active; }

    Session snapshot() const { return Session{m_strokes, m_active}; }

    size_t addObserver(Observer observer) {
        m_observers.emplace_back(++m_nextObserverId, std::move(observer));
        return m_nextObserverId;
    }

    void removeObserver(size_t id) {
        for (auto it = m_observers.begin(); it != m_observers.end(); ++it) {
            if (it->first == id) {
                m_observers.erase(it);
                return;
            }
        }
    }

    // One "stroke,x,y" line per point; the active stroke is not written.
    bool exportCSV(const std::string &path) const {
        std::ofstream out(path);
        if (!out.is_open())
            return false;
        out.imbue(std::locale::classic());
        out << std::setprecision(std::numeric_limits<float>::max_digits10);
        for (size_t i = 0; i < m_strokes.size(); ++i) {
            for (const auto &p : m_strokes[i])
                out << i << ',' << p.x << ',' << p.y << '\n';
        }
        return out.good();
    }

    // Replaces the session with the strokes read from path. A new stroke
    // starts whenever the stroke column changes.
    bool importCSV(const std::string &path) {
        std::ifstream in(path);
        if (!in.is_open())
            return false;
        std::vector<Stroke> loaded;
        std::string line;
        std::string currentId;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty() || line[0] == '#')
                continue;
            std::stringstream ss(line);
            std::string id, xs, ys;
            if (!std::getline(ss, id, ',') || !std::getline(ss, xs, ',') ||
                !std::getline(ss, ys, ','))
                return false;
            Point p{};
            if (!parseCoordinate(xs, p.x) || !parseCoordinate(ys, p.y))
                return false;
            if (loaded.empty() || id != currentId) {
                loaded.emplace_back();
                currentId = id;
            }
            loaded.back().push_back(p);
        }
        m_strokes = std::move(loaded);
        m_active.clear();
        m_hasActive = false;
        notify();
        return true;
    }

private:
    // Always '.' as decimal separator, whatever the process locale is.
    static bool parseCoordinate(const std::string &text, float &value) {
        std::istringstream in(text);
        in.imbue(std::locale::classic());
        in >> value;
        if (in.fail())
            return false;
        in >> std::ws;
        return in.eof();
    }

    void notify() const {
        for (const auto &entry : m_observers)
            entry.second(*this);
    }

    std::vector<Stroke> m_strokes;
    Stroke m_active;
    bool m_hasActive{false};
    size_t m_nextObserverId{0};
    std::vector<std::pair<size_t, Observer>> m_observers;
};

} // namespace kc
