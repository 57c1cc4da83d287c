#include "sdet/postprocess.hpp"
#include <cmath>

namespace sdet {
namespace {
// Returns the blob as rows = attributes, cols = anchors.
cv::Mat attribute_major(const cv::Mat& out){
  if(out.dims==3 && out.size[0]==1){
    int a=out.size[1], b=out.size[2];
    cv::Mat m(a, b, CV_32F, const_cast<void*>(static_cast<const void*>(out.ptr<float>())));
    return a<=b ? m : cv::Mat(m.t());
  }
  if(out.dims==2) return out.rows<=out.cols ? out : cv::Mat(out.t());
  return cv::Mat();
}
}

int obb_class_count(const cv::Mat& out){
  if(out.type()!=CV_32F) return -1;
  cv::Mat m = attribute_major(out);
  if(m.empty() || m.rows<6) return -1;
  return m.rows-5;
}

Dets decode_obb(const cv::Mat& out, float conf, const LetterboxInfo& lb,
                const std::vector<std::string>& names){
  int nc = obb_class_count(out);
  Dets ds;
  if(nc<=0) return ds;
  cv::Mat m = attribute_major(out);
  if(!m.isContinuous()) m = m.clone();
  const int n = m.cols;
  const float* cx=m.ptr<float>(0); const float* cy=m.ptr<float>(1);
  const float* w=m.ptr<float>(2);  const float* h=m.ptr<float>(3);
  const float* ang=m.ptr<float>(4+nc);
  for(int i=0;i<n;++i){
    int best=-1; float bs=0.f;
    for(int c=0;c<nc;++c){ float s=m.at<float>(4+c,i); if(s>bs){bs=s;best=c;} }
    if(best<0 || bs<conf) continue;
    Detection d;
    d.box = cv::RotatedRect(lb.to_frame({cx[i],cy[i]}), cv::Size2f(w[i]/lb.scale, h[i]/lb.scale),
                            ang[i]*180.f/(float)CV_PI);
    d.cls = best; d.score = bs;
    d.label = best<(int)names.size() ? names[best] : "cls" + std::to_string(best);
    ds.push_back(std::move(d));
  }
  return ds;
}
}
