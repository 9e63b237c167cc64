#include "segmentation/segment_renderer.h"
#include <opencv2/imgproc.hpp>

namespace segmentation {

cv::Mat compute_boundary_mask(const SegmentationIndividual& individual) {
    const problem::ProblemInstance& instance = individual.get_problem_instance();
    const std::vector<int>& labels = individual.get_segments().labels;
    int w = instance.get_width(), h = instance.get_height();

    cv::Mat mask = cv::Mat::zeros(h, w, CV_8U);
    for (int y = 0; y < h; ++y) {
        uchar* row = mask.ptr<uchar>(y);
        for (int x = 0; x < w; ++x) {
            int i = y * w + x;
            bool right_differs = x < w - 1 && labels[i] != labels[i + 1];
            bool below_differs = y < h - 1 && labels[i] != labels[i + w];
            if (right_differs || below_differs) {
                row[x] = 255;
            }
        }
    }
    return mask;
}

cv::Mat render_boundary_overlay(const SegmentationIndividual& individual,
                                const cv::Scalar& boundary_color_bgr) {
    const problem::ProblemInstance& instance = individual.get_problem_instance();

    cv::Mat overlay = instance.get_image().clone();
    overlay.setTo(boundary_color_bgr, compute_boundary_mask(individual));

    cv::Size original_size(instance.get_original_width(), instance.get_original_height());
    if (overlay.size() != original_size) {
        cv::Mat resized;
        cv::resize(overlay, resized, original_size, 0, 0, cv::INTER_NEAREST);
        return resized;
    }
    return overlay;
}

} // namespace segmentation
