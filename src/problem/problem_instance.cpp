#include "problem/problem_instance.h"
#include "problem/color_distance.h"
#include "core/errors.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

using namespace std;

namespace problem {

namespace {

cv::Mat validated_image(const cv::Mat& image, float image_scaling) {
    if (image.empty()) {
        throw invalid_argument("ProblemInstance: empty image");
    }
    if (image.type() != CV_8UC3) {
        throw invalid_argument("ProblemInstance: expected an 8-bit 3-channel image");
    }
    if (!(image_scaling > 0.0f)) {
        throw invalid_argument("ProblemInstance: image scaling must be positive");
    }

    if (image_scaling == 1.0f) {
        return image.clone();
    }

    // Keep at least one pixel in each dimension
    int w = max(1, static_cast<int>(lround(image.cols * image_scaling)));
    int h = max(1, static_cast<int>(lround(image.rows * image_scaling)));

    cv::Mat scaled;
    int interpolation = image_scaling < 1.0f ? cv::INTER_AREA : cv::INTER_LINEAR;
    cv::resize(image, scaled, cv::Size(w, h), 0, 0, interpolation);
    return scaled;
}

} // namespace

ProblemInstance::ProblemInstance(const string& name, const cv::Mat& image, float image_scaling)
    : name_(name)
    , original_width_(image.cols)
    , original_height_(image.rows)
    , image_scaling_(image_scaling)
    , image_(validated_image(image, image_scaling))
    , euclidean_distance_graph_(image_.cols * image_.rows)
{
    int w = image_.cols, h = image_.rows;

    // RGB and HSB of each pixel
    cv::cvtColor(image_, rgb_, cv::COLOR_BGR2RGB);

    cv::Mat rgb_float;
    rgb_.convertTo(rgb_float, CV_32FC3, 1.0 / 255.0);
    cv::cvtColor(rgb_float, hsb_, cv::COLOR_RGB2HSV);  // H in [0, 360), S and V in [0, 1]
    for (int y = 0; y < h; ++y) {
        cv::Vec3f* row = hsb_.ptr<cv::Vec3f>(y);
        for (int x = 0; x < w; ++x) {
            row[x][0] /= 360.0f;
        }
    }

    // Connect each pixel to its right and lower neighbour, which covers
    // every 4-adjacent pair exactly once
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int i = y * w + x;
            if (x < w - 1) {
                euclidean_distance_graph_.add_connection(i, i + 1, get_euclidean_distance(i, i + 1));
            }
            if (y < h - 1) {
                euclidean_distance_graph_.add_connection(i, i + w, get_euclidean_distance(i, i + w));
            }
        }
    }
}

void ProblemInstance::check_index(int i) const {
    if (i < 0 || i >= get_pixel_count()) {
        throw core::OutOfRange("ProblemInstance: pixel index " + std::to_string(i) +
                               " outside [0, " + std::to_string(get_pixel_count()) + ")");
    }
}

cv::Vec3b ProblemInstance::get_rgb(int i) const {
    cv::Point pos = pixel_index_to_pos(i);
    return rgb_.at<cv::Vec3b>(pos.y, pos.x);
}

cv::Vec3f ProblemInstance::get_hsb(int i) const {
    cv::Point pos = pixel_index_to_pos(i);
    return hsb_.at<cv::Vec3f>(pos.y, pos.x);
}

cv::Point ProblemInstance::pixel_index_to_pos(int i) const {
    check_index(i);
    int x = i % get_width();
    int y = i / get_width();
    return cv::Point(x, y);
}

int ProblemInstance::pos_to_pixel_index(int x, int y) const {
    if (x < 0 || x >= get_width() || y < 0 || y >= get_height()) {
        throw core::OutOfRange("ProblemInstance: position (" + std::to_string(x) + ", " +
                               std::to_string(y) + ") outside the image");
    }
    return y * get_width() + x;
}

Direction ProblemInstance::get_direction(int i, int j) const {
    cv::Point from = pixel_index_to_pos(i);
    cv::Point to = pixel_index_to_pos(j);
    return get_direction(from.x, from.y, to.x, to.y);
}

Direction ProblemInstance::get_direction(int xfrom, int yfrom, int xto, int yto) const {
    if (yfrom == yto) {
        if (xto == xfrom + 1)
            return Direction::RIGHT;
        else if (xto == xfrom - 1)
            return Direction::LEFT;
    }
    else if (xfrom == xto) {
        if (yto == yfrom + 1)
            return Direction::DOWN;
        else if (yto == yfrom - 1)
            return Direction::UP;
    }
    return Direction::NONE;
}

int ProblemInstance::get_neighbor(int i, Direction direction) const {
    cv::Point pos = pixel_index_to_pos(i);
    switch (direction) {
    case Direction::UP:    return pos_to_pixel_index(pos.x, pos.y - 1);
    case Direction::DOWN:  return pos_to_pixel_index(pos.x, pos.y + 1);
    case Direction::LEFT:  return pos_to_pixel_index(pos.x - 1, pos.y);
    case Direction::RIGHT: return pos_to_pixel_index(pos.x + 1, pos.y);
    case Direction::NONE:  break;
    }
    return -1;
}

vector<Direction> ProblemInstance::get_valid_directions(int i) const {
    cv::Point pos = pixel_index_to_pos(i);

    vector<Direction> directions;
    directions.reserve(4);
    if (pos.y > 0)                directions.push_back(Direction::UP);
    if (pos.y < get_height() - 1) directions.push_back(Direction::DOWN);
    if (pos.x > 0)                directions.push_back(Direction::LEFT);
    if (pos.x < get_width() - 1)  directions.push_back(Direction::RIGHT);
    return directions;
}

float ProblemInstance::get_euclidean_distance(int i, int j) const {
    return euclidean_distance(get_hsb(i), get_hsb(j));
}

} // namespace problem
