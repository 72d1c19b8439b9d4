#pragma once
#include <string>
#include <vector>

namespace automat {

// Position in an original (pre-include) source file.
struct SourceLoc { int file=0; int line=-1; int col=-1; };

// Names of every unit that contributed text to one compilation; index 0 is the main unit.
class SourceFiles {
public:
    int add(const std::string& name){
        for(size_t i=0;i<names_.size();++i) if(names_[i]==name) return static_cast<int>(i);
        names_.push_back(name);
        return static_cast<int>(names_.size()-1);
    }
    const std::string& name(int idx) const {
        static const std::string unknown = "<unknown>";
        if(idx<0 || static_cast<size_t>(idx)>=names_.size()) return unknown;
        return names_[static_cast<size_t>(idx)];
    }
    size_t size() const { return names_.size(); }
private:
    std::vector<std::string> names_;
};

} // namespace automat
