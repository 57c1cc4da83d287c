#include "sdet/postprocess.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace sdet {
float IoU(const cv::RotatedRect& a, const cv::RotatedRect& b){
  float aa = a.size.area(), ab = b.size.area();
  if(!(aa>0.f) || !(ab>0.f)) return 0.f;
  std::vector<cv::Point2f> poly;
  if(cv::rotatedRectangleIntersection(a,b,poly)==cv::INTERSECT_NONE || poly.size()<3) return 0.f;
  std::vector<cv::Point2f> hull; cv::convexHull(poly, hull);
  float inter = (float)cv::contourArea(hull);
  float ua = aa + ab - inter;
  return ua>0.f ? std::min(1.f, inter/ua) : 0.f;
}

Dets NMS(const Dets& ds, float thr){
  auto sorted=ds;
  std::stable_sort(sorted.begin(), sorted.end(),[](const Detection&a,const Detection&b){return a.score>b.score;});
  std::vector<char> sup(sorted.size(),0);
  Dets out; out.reserve(sorted.size());
  for(size_t i=0;i<sorted.size();++i){ if(sup[i]) continue; out.push_back(sorted[i]);
    for(size_t j=i+1;j<sorted.size();++j){
      if(sup[j] || sorted[j].cls!=sorted[i].cls) continue;
      if(IoU(sorted[i].box,sorted[j].box)>thr) sup[j]=1; } }
  return out;
}
}
