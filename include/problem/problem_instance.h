#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "graph/pixel_graph.h"
#include "problem/direction.h"

namespace problem {

/**
 * ProblemInstance - One image segmentation problem
 *
 * Holds the working image (the input, optionally rescaled), the RGB and
 * HSB value of every pixel, and a graph connecting each pixel to its
 * 4-connected neighbours with edges weighted by HSB distance.
 *
 * Built once and immutable afterwards. Individuals share it through
 * std::shared_ptr<const ProblemInstance>.
 *
 * Pixel indices are flattened: index = y * width + x.
 */
class ProblemInstance {
public:
    /**
     * Create a problem instance
     * @param name Name of this problem instance (usually the image path)
     * @param image Input image, 8-bit 3-channel BGR (OpenCV convention)
     * @param image_scaling Ratio by which to scale the input image (1 = unchanged)
     * @throws std::invalid_argument on an empty or non CV_8UC3 image, or scaling <= 0
     */
    ProblemInstance(const std::string& name, const cv::Mat& image, float image_scaling = 1.0f);

    // Non-copyable (shared by pointer)
    ProblemInstance(const ProblemInstance&) = delete;
    ProblemInstance& operator=(const ProblemInstance&) = delete;

    const std::string& get_name() const { return name_; }

    /**
     * Get the working image (after scaling), BGR
     */
    const cv::Mat& get_image() const { return image_; }

    int get_width() const { return image_.cols; }
    int get_height() const { return image_.rows; }
    int get_pixel_count() const { return image_.cols * image_.rows; }

    int get_original_width() const { return original_width_; }
    int get_original_height() const { return original_height_; }
    float get_image_scaling() const { return image_scaling_; }

    /**
     * Get the RGB of a pixel
     * @return [r, g, b] in 0-255
     */
    cv::Vec3b get_rgb(int i) const;

    /**
     * Get the HSB (hue, saturation, brightness) of a pixel
     * @return [h, s, b], each in [0, 1]
     */
    cv::Vec3f get_hsb(int i) const;

    /**
     * Project a pixel index into a 2D position
     * @throws core::OutOfRange if i is outside [0, width * height)
     */
    cv::Point pixel_index_to_pos(int i) const;

    /**
     * Flatten a 2D position into a pixel index
     * @throws core::OutOfRange if (x, y) is outside the image
     */
    int pos_to_pixel_index(int x, int y) const;

    /**
     * Get the direction to go from a pixel to an adjacent one
     * (e.g. from i=0 to i=1 the direction is RIGHT)
     * @return Direction::NONE if the pixels are not adjacent
     */
    Direction get_direction(int i, int j) const;
    Direction get_direction(int xfrom, int yfrom, int xto, int yto) const;

    /**
     * Get the neighbour of a pixel in a given direction
     * @return neighbour index, or -1 for Direction::NONE
     * @throws core::OutOfRange if the direction leads off the grid
     */
    int get_neighbor(int i, Direction direction) const;

    /**
     * Get the directions from a pixel that stay on the grid (never NONE)
     */
    std::vector<Direction> get_valid_directions(int i) const;

    /**
     * Euclidean distance between two pixels in HSB color space
     */
    float get_euclidean_distance(int i, int j) const;

    /**
     * Graph in which each pixel is connected to its cardinal neighbours,
     * weighted by HSB distance
     */
    const graph::PixelGraph& get_euclidean_distance_graph() const { return euclidean_distance_graph_; }

private:
    void check_index(int i) const;

    std::string name_;
    int original_width_;
    int original_height_;
    float image_scaling_;

    cv::Mat image_;   // CV_8UC3, BGR
    cv::Mat rgb_;     // CV_8UC3, RGB
    cv::Mat hsb_;     // CV_32FC3, all channels in [0, 1]

    graph::PixelGraph euclidean_distance_graph_;
};

} // namespace problem
