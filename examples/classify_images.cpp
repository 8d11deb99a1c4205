// classify_images.cpp
// Classifies disk image identifiers against a pair of version patterns
// Usage: classify_images <all-versions-regex> <target-version-regex> <image>...

#include <iostream>
#include "vdalign/vdalign.hpp"

using namespace vdalign;

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <all-versions-regex> <target-version-regex> <image>..."
                  << std::endl;
        return 1;
    }

    try {
        PatternClassifier classifier(argv[1], argv[2]);

        for (int i = 3; i < argc; ++i) {
            std::string image = argv[i];
            DiskImageId id;
            if (image != "-") {
                id = image;
            }
            std::cout << (id ? image : std::string(UNRESOLVED_IMAGE_LABEL)) << ": "
                      << Utils::update_status_to_string(classifier.classify(id)) << std::endl;
        }

    } catch (const ConfigError& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
