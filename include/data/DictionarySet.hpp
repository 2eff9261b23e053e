#pragma once

#include <initializer_list>
#include <string>
#include <unordered_set>

namespace lexicon {

    // Tells a lookup which dictionaries are currently enabled. Membership is
    // evaluated per candidate row, so implementations may compute it on the fly.
    class DictionarySet {
    public:
        virtual ~DictionarySet() = default;
        virtual bool has(const std::string& name) const = 0;
    };

    class NameSet : public DictionarySet {
    public:
        NameSet() = default;
        NameSet(std::initializer_list<std::string> names) : names_(names) {}

        void add(const std::string& name) { names_.insert(name); }
        void remove(const std::string& name) { names_.erase(name); }
        size_t size() const { return names_.size(); }

        bool has(const std::string& name) const override {
            return names_.find(name) != names_.end();
        }

    private:
        std::unordered_set<std::string> names_;
    };
}
