#pragma once

#include <opencv2/core.hpp>
#include "segmentation/segmentation_individual.h"

namespace segmentation {

/**
 * Paint segment boundaries over the working image
 *
 * A pixel is a boundary pixel when its right or lower neighbour belongs to
 * another segment. The result is resized back to the original image size
 * (nearest neighbour) when the problem instance was scaled.
 *
 * @param individual Segmentation to draw
 * @param boundary_color_bgr Color of boundary pixels
 * @return BGR image, original size
 */
cv::Mat render_boundary_overlay(const SegmentationIndividual& individual,
                                const cv::Scalar& boundary_color_bgr = cv::Scalar(0, 255, 0));

/**
 * Binary boundary mask at working resolution (255 = boundary)
 */
cv::Mat compute_boundary_mask(const SegmentationIndividual& individual);

} // namespace segmentation
