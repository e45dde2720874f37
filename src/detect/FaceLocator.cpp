#include "detect/FaceLocator.hpp"
#include <QtCore/QDebug>

std::vector<FaceBox> TieredLocator::locate(const cv::Mat& rgb) const
{
	if (fast_) {
		auto boxes = fast_->locate(rgb);
		if (!boxes.empty()) return boxes;
		qDebug() << "[TieredLocator] fast detector found nothing, retry with accurate";
	}
	return accurate_.locate(rgb);
}
