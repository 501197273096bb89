#include <boxtrack/boxtrack.hpp>
#include <Eigen/Dense>
#include <iostream>
#include <vector>

int main() {
    std::cout << "boxtrack - Simple Tracking Example\n";
    std::cout << "==================================\n\n";

    // Create tracker
    boxtrack::trackers::Sort tracker(
        1,     // max_age
        3,     // min_hits
        0.3f   // iou_threshold
    );

    std::cout << "Processing 10 frames with synthetic detections...\n\n";

    for (int frame = 0; frame < 10; ++frame) {
        std::vector<boxtrack::Detection> detections;

        // Object 1: moving right
        detections.emplace_back(
            Eigen::Vector4f(50.0f + frame * 10.0f, 100.0f, 150.0f + frame * 10.0f, 200.0f),
            "person", 0.8f);

        // Object 2: moving down
        detections.emplace_back(
            Eigen::Vector4f(300.0f, 50.0f + frame * 8.0f, 400.0f, 150.0f + frame * 8.0f),
            "car", 0.75f);

        // Object 3: moving diagonally, missed on frame 5
        if (frame != 5) {
            detections.emplace_back(
                Eigen::Vector4f(450.0f + frame * 5.0f, 200.0f + frame * 6.0f,
                                550.0f + frame * 5.0f, 300.0f + frame * 6.0f),
                "person", 0.7f);
        }

        // Update tracker
        std::vector<boxtrack::Track> tracks = tracker.update(detections);

        std::cout << "Frame " << frame << ": Detected " << detections.size()
                  << " objects, Tracking " << tracks.size() << " objects\n";

        for (const auto& track : tracks) {
            std::cout << "  " << track << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Test completed successfully!\n";
    return 0;
}
